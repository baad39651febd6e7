// Tests for SpeechPipeline: sequential requests, draining, retries, chapters

#include <QtTest>
#include <QSignalSpy>

#include "../common/test_base.h"
#include "../common/fake_media.h"

#include "core/playback/timeline_compositor.h"
#include "core/speech/speech_pipeline.h"

using namespace lector;

class TestSpeechPipeline : public TestBase {
    Q_OBJECT

private:
    FakeSpeechService m_service;
    std::shared_ptr<FakeDurationProbe::State> m_probe;
    std::unique_ptr<TimelineCompositor> m_compositor;

    std::unique_ptr<SpeechPipeline> makePipeline(const QStringList& texts) {
        return std::make_unique<SpeechPipeline>(std::make_unique<ListSegmentSource>(texts),
                                                &m_service, m_compositor.get());
    }

private slots:
    void initTestCase() override {
        TestBase::initTestCase();
        qRegisterMetaType<smp::Error>();
    }

    void init() override {
        TestBase::init();
        m_service = FakeSpeechService();
        auto probe = std::make_unique<FakeDurationProbe>();
        probe->state->immediate = true;
        m_probe = probe->state;
        m_compositor = std::make_unique<TimelineCompositor>(std::make_unique<FakePlaybackFactory>(),
                                                            std::move(probe));
    }

    void cleanup() override {
        TestBase::cleanup();
        m_compositor.reset();
    }

    // ── Happy path ──

    void test_segments_become_contiguous_chapters() {
        m_probe->durations = {sec(2.0), sec(3.5), sec(1.0)};
        auto pipeline = makePipeline({"One.", "Two.", "Three."});
        QSignalSpy loaded(pipeline.get(), &SpeechPipeline::segmentLoaded);
        QSignalSpy finished(pipeline.get(), &SpeechPipeline::finished);

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        QCOMPARE(m_service.texts, QStringList({"One.", "Two.", "Three."}));
        const auto& chapters = pipeline->chapters();
        QCOMPARE(static_cast<int>(chapters.size()), 3);
        QCOMPARE(chapters[0].timeRange, (smp::TimeSpan{0, sec(2.0)}));
        QCOMPARE(chapters[1].timeRange, (smp::TimeSpan{sec(2.0), sec(5.5)}));
        QCOMPARE(chapters[2].timeRange, (smp::TimeSpan{sec(5.5), sec(6.5)}));
        QCOMPARE(loaded.count(), 3);
        QCOMPARE(finished.count(), 1);
        QVERIFY(!pipeline->failed());
        QVERIFY(m_compositor->isInputEnded());
        QCOMPARE(static_cast<int>(pipeline->responses().size()), 3);
    }

    void test_one_request_in_flight() {
        auto pipeline = makePipeline({"a", "b", "c"});
        pipeline->start();
        QCOMPARE(m_service.texts.size(), 1);

        QTRY_VERIFY(pipeline->completed());
        QCOMPARE(m_service.maxInFlight, 1);
    }

    void test_body_parts_concatenated_into_one_chunk() {
        FakeSpeechService::Script script;
        script.parts = {"ab", "cd", "ef"};
        m_service.scripts.push_back(script);
        auto pipeline = makePipeline({"Hello"});

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        QCOMPARE(m_compositor->chunkCount(), 1);
        QCOMPARE(m_compositor->chunk(0).bytes, QByteArray("abcdef"));
        QCOMPARE(pipeline->responses()[0].content, QByteArray("abcdef"));
        QCOMPARE(pipeline->responses()[0].text, QString("Hello"));
    }

    void test_empty_body_yields_empty_chapter() {
        m_probe->durations = {sec(2.0), sec(1.0)};
        FakeSpeechService::Script normal;
        FakeSpeechService::Script empty;
        empty.emptyBody = true;
        m_service.scripts = {normal, empty, normal};
        auto pipeline = makePipeline({"a", "b", "c"});

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        const auto& chapters = pipeline->chapters();
        QCOMPARE(static_cast<int>(chapters.size()), 3);
        QCOMPARE(chapters[1].timeRange, (smp::TimeSpan{sec(2.0), sec(2.0)}));
        QCOMPARE(chapters[2].timeRange, (smp::TimeSpan{sec(2.0), sec(3.0)}));
        QCOMPARE(m_compositor->chunkCount(), 2);
    }

    void test_undecodable_chunk_yields_empty_chapter() {
        // Measurement fails for the middle chunk and reports zero
        m_probe->durations = {sec(2.0), 0, sec(1.0)};
        auto pipeline = makePipeline({"a", "b", "c"});

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        const auto& chapters = pipeline->chapters();
        QCOMPARE(static_cast<int>(chapters.size()), 3);
        QCOMPARE(chapters[1].timeRange, (smp::TimeSpan{sec(2.0), sec(2.0)}));
        QCOMPARE(chapters[2].timeRange.start, sec(2.0));
        QCOMPARE(m_compositor->chunkCount(), 3);
        QCOMPARE(m_compositor->chunk(1).span, (smp::TimeSpan{sec(2.0), sec(2.0)}));
        QCOMPARE(m_compositor->duration(), sec(3.0));
    }

    void test_word_timestamps_kept_with_response() {
        FakeSpeechService::Script script;
        WordTimestamp word;
        word.timeRange = smp::TimeSpan{sec(0.4), sec(0.9)};
        word.textRange = TextRange{6, 11};
        script.words = {word};
        m_service.scripts.push_back(script);
        auto pipeline = makePipeline({"Hello world"});

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        QCOMPARE(static_cast<int>(pipeline->responses()[0].wordTimestamps.size()), 1);
        QVERIFY(pipeline->responses()[0].wordTimestamps[0].textRange == (TextRange{6, 11}));
    }

    // ── Failures ──

    void test_transient_failures_retried_with_same_text() {
        FakeSpeechService::Script failing;
        failing.error = smp::Error::network("connection reset");
        m_service.scripts = {failing, failing};
        auto pipeline = makePipeline({"Retry me", "Next"});
        QSignalSpy errors(pipeline.get(), &SpeechPipeline::errorOccurred);

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        QCOMPARE(m_service.texts, QStringList({"Retry me", "Retry me", "Retry me", "Next"}));
        QCOMPARE(static_cast<int>(pipeline->chapters().size()), 2);
        QCOMPARE(errors.count(), 0);
    }

    void test_body_failure_counts_as_attempt() {
        FakeSpeechService::Script broken;
        broken.parts = {"partial"};
        broken.bodyError = smp::Error::network("stream cut");
        m_service.scripts = {broken};
        auto pipeline = makePipeline({"Body"});

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());

        QCOMPARE(m_service.texts.size(), 2);
        QCOMPARE(m_compositor->chunk(0).bytes, QByteArray("audio:Body"));
    }

    void test_exhausted_retries_fail_pipeline() {
        FakeSpeechService::Script failing;
        failing.error = smp::Error::service("Failed to generate speech");
        m_service.scripts = {failing, failing, failing};
        auto pipeline = makePipeline({"First", "Second"});
        QSignalSpy errors(pipeline.get(), &SpeechPipeline::errorOccurred);
        QSignalSpy finished(pipeline.get(), &SpeechPipeline::finished);

        pipeline->start();
        QTRY_VERIFY(pipeline->completed());
        drainEvents();

        QVERIFY(pipeline->failed());
        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.at(0).at(0).value<smp::Error>().code, smp::ErrorCode::ServiceError);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(m_service.texts, QStringList({"First", "First", "First"}));
        QVERIFY(pipeline->chapters().empty());
        QVERIFY(m_compositor->isInputEnded());
        QCOMPARE(m_compositor->state(), PlaybackState::Ended);
    }

    // ── Disposal ──

    void test_dispose_aborts_in_flight_request() {
        auto pipeline = makePipeline({"a", "b"});
        pipeline->start();
        pipeline->dispose();
        drainEvents();

        QCOMPARE(m_service.texts.size(), 1);
        QVERIFY(pipeline->chapters().empty());
        QVERIFY(!pipeline->completed());
    }
};

QTEST_MAIN(TestSpeechPipeline)
#include "test_speech_pipeline.moc"
