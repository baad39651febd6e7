// Tests for NarrationSynchronizer: word lookup, highlight, deferred play, scrolling

#include <QtTest>
#include <QSignalSpy>

#include "../common/test_base.h"
#include "../common/fake_media.h"

#include "core/playback/timeline_compositor.h"
#include "core/speech/speech_pipeline.h"
#include "core/sync/narration_synchronizer.h"

using namespace lector;

namespace {

WordTimestamp word(double start, double end, int textStart, int textEnd)
{
    WordTimestamp w;
    w.timeRange = smp::TimeSpan{smp::seconds_to_us(start), smp::seconds_to_us(end)};
    w.textRange = TextRange{textStart, textEnd};
    return w;
}

TextSegment segment(const QStringList& runs)
{
    TextSegment s;
    s.runs = runs;
    return s;
}

} // namespace

class TestNarrationSynchronizer : public TestBase {
    Q_OBJECT

private:
    FakeSpeechService m_service;
    std::shared_ptr<FakeDurationProbe::State> m_probe;
    std::unique_ptr<TimelineCompositor> m_compositor;
    std::unique_ptr<SpeechPipeline> m_pipeline;
    std::unique_ptr<NarrationSynchronizer> m_sync;

    // Three paragraphs of 2.0 s, 3.5 s and 1.0 s
    void build(bool immediate = true) {
        std::vector<TextSegment> segments = {
            segment({"Hello world"}),
            segment({"Second ", "part here"}),
            segment({"End."}),
        };
        QStringList texts;
        for (const auto& s : segments) {
            texts << s.text();
        }

        FakeSpeechService::Script first;
        first.words = {word(0.0, 0.4, 0, 5), word(0.4, 0.9, 6, 11)};
        FakeSpeechService::Script second;
        second.words = {word(0.0, 0.3, 0, 6), word(0.3, 0.6, 7, 11), word(0.6, 0.9, 12, 16)};
        FakeSpeechService::Script third;
        third.words = {word(0.0, 0.5, 0, 3)};
        m_service.scripts = {first, second, third};

        auto probe = std::make_unique<FakeDurationProbe>();
        probe->state->immediate = immediate;
        probe->state->durations = {sec(2.0), sec(3.5), sec(1.0)};
        m_probe = probe->state;
        m_compositor = std::make_unique<TimelineCompositor>(std::make_unique<FakePlaybackFactory>(),
                                                            std::move(probe));
        m_pipeline = std::make_unique<SpeechPipeline>(std::make_unique<ListSegmentSource>(texts),
                                                      &m_service, m_compositor.get());
        SyncConfig config;
        config.hoverThrottleMs = 50;
        m_sync = std::make_unique<NarrationSynchronizer>(segments, m_compositor.get(), m_pipeline.get(), config);
    }

    void loadAll() {
        m_pipeline->start();
        QTRY_VERIFY(m_pipeline->completed());
    }

private slots:
    void initTestCase() override {
        TestBase::initTestCase();
        qRegisterMetaType<lector::BufferingState>();
        qRegisterMetaType<lector::PlaybackState>();
        qRegisterMetaType<lector::WordHighlight>();
        qRegisterMetaType<lector::ScrollDirection>();
    }

    void init() override {
        TestBase::init();
        m_service = FakeSpeechService();
    }

    void cleanup() override {
        m_sync.reset();
        m_pipeline.reset();
        m_compositor.reset();
        TestBase::cleanup();
    }

    // ── Lookup ──

    void test_word_active_inside_its_time_range() {
        build();
        loadAll();

        auto active = m_sync->wordAtTime(sec(0.6));
        QVERIFY(active.has_value());
        QCOMPARE(active->segment, 0);
        QVERIFY(active->textRange == (TextRange{6, 11}));
        QCOMPARE(active->startTime, sec(0.4));

        QVERIFY(!m_sync->wordAtTime(sec(1.0)).has_value());
    }

    void test_lookup_is_stable() {
        build();
        loadAll();
        auto a = m_sync->wordAtTime(sec(2.4));
        auto b = m_sync->wordAtTime(sec(2.4));
        QVERIFY(a.has_value() && b.has_value());
        QCOMPARE(a->segment, 1);
        QVERIFY(a->textRange == b->textRange);
        QVERIFY(a->textRange == (TextRange{7, 11}));
    }

    void test_chapters_partition_timeline() {
        build();
        loadAll();
        const auto& chapters = m_pipeline->chapters();
        QCOMPARE(chapters.front().timeRange.start, smp::TimeUS(0));
        for (size_t i = 1; i < chapters.size(); ++i) {
            QCOMPARE(chapters[i].timeRange.start, chapters[i - 1].timeRange.end);
        }
        QCOMPARE(chapters.back().timeRange.end, m_compositor->duration());
        QCOMPARE(m_sync->chapterAtTime(sec(6.0)), 2);
        QCOMPARE(m_sync->chapterAtTime(sec(7.0)), -1);
    }

    // ── Highlight ──

    void test_highlight_fires_only_on_change() {
        build();
        loadAll();
        QSignalSpy highlighted(m_sync.get(), &NarrationSynchronizer::wordHighlighted);

        m_compositor->setCurrentTime(sec(0.1));
        m_sync->updateHighlight();
        m_sync->updateHighlight();
        m_compositor->setCurrentTime(sec(0.3));
        m_sync->updateHighlight();
        QCOMPARE(highlighted.count(), 1);

        m_compositor->setCurrentTime(sec(0.5));
        m_sync->updateHighlight();
        QCOMPARE(highlighted.count(), 2);
        auto highlight = highlighted.at(1).at(0).value<WordHighlight>();
        QCOMPARE(highlight.segment, 0);
        QVERIFY(highlight.textRange == (TextRange{6, 11}));
    }

    void test_highlight_maps_onto_runs() {
        build();
        loadAll();

        // "Second " + "part here": word [7, 11) lies in the second run
        m_compositor->setCurrentTime(sec(2.4));
        m_sync->updateHighlight();

        const WordHighlight& highlight = m_sync->currentHighlight();
        QCOMPARE(highlight.runs.size(), 1);
        QCOMPARE(highlight.runs[0].run, 1);
        QCOMPARE(highlight.runs[0].start, 0);
        QCOMPARE(highlight.runs[0].end, 4);
    }

    void test_polling_follows_play_state() {
        build();
        loadAll();
        QSignalSpy highlighted(m_sync.get(), &NarrationSynchronizer::wordHighlighted);

        m_compositor->play();
        QCOMPARE(highlighted.count(), 1);

        m_compositor->setCurrentTime(sec(0.5));
        QTRY_COMPARE(highlighted.count(), 2);

        m_compositor->pause();
        m_compositor->setCurrentTime(sec(2.1));
        QTest::qWait(50);
        QCOMPARE(highlighted.count(), 2);
    }

    void test_ended_clears_highlight() {
        build();
        loadAll();
        QSignalSpy cleared(m_sync.get(), &NarrationSynchronizer::highlightCleared);
        m_compositor->setCurrentTime(sec(0.1));
        m_sync->updateHighlight();

        m_compositor->setCurrentTime(sec(60));

        QCOMPARE(m_compositor->state(), PlaybackState::Ended);
        QCOMPARE(cleared.count(), 1);
        QCOMPARE(m_sync->currentHighlight().segment, -1);
    }

    // ── Play from position ──

    void test_play_segment_seeks_to_chapter() {
        build();
        loadAll();

        m_sync->playSegment(1);

        QCOMPARE(m_compositor->currentTime(), sec(2.0));
        QCOMPARE(m_compositor->state(), PlaybackState::Play);
    }

    void test_play_segment_out_of_range_ignored() {
        build();
        loadAll();
        m_sync->playSegment(7);
        m_sync->playSegment(-1);
        QCOMPARE(m_compositor->state(), PlaybackState::Pause);
    }

    void test_play_segment_deferred_until_chapter_arrives() {
        build(false);
        m_pipeline->start();
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 1);
        m_probe->resolve(0, sec(2.0));
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 2);
        m_probe->resolve(1, sec(3.5));
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 3);

        QSignalSpy buffering(m_sync.get(), &NarrationSynchronizer::bufferingStateChanged);
        m_sync->playSegment(2);

        QCOMPARE(m_sync->pendingSegment(), 2);
        QCOMPARE(m_sync->bufferingState(), BufferingState::Buffering);
        QVERIFY(buffering.count() >= 1);
        QCOMPARE(buffering.last().at(0).value<BufferingState>(), BufferingState::Buffering);
        QCOMPARE(m_compositor->state(), PlaybackState::Pause);

        m_probe->resolve(2, sec(1.0));

        QCOMPARE(m_sync->pendingSegment(), -1);
        QCOMPARE(m_compositor->currentTime(), sec(5.5));
        QCOMPARE(m_compositor->state(), PlaybackState::Play);
        QCOMPARE(buffering.last().at(0).value<BufferingState>(), m_compositor->bufferingState());
    }

    void test_play_cancels_deferred_request_and_reports_buffering() {
        build(false);
        m_pipeline->start();
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 1);
        m_sync->playSegment(2);
        QCOMPARE(m_sync->bufferingState(), BufferingState::Buffering);

        QSignalSpy buffering(m_sync.get(), &NarrationSynchronizer::bufferingStateChanged);
        m_compositor->play();

        QCOMPARE(m_sync->pendingSegment(), -1);
        QVERIFY(buffering.count() >= 1);
        QCOMPARE(buffering.last().at(0).value<BufferingState>(), m_compositor->bufferingState());
        QCOMPARE(m_sync->bufferingState(), m_compositor->bufferingState());
    }

    void test_deferred_play_dropped_when_pipeline_finishes() {
        build(false);
        FakeSpeechService::Script failing;
        failing.error = smp::Error::network("offline");
        m_service.scripts[1] = failing;
        m_service.scripts.insert(m_service.scripts.begin() + 2, {failing, failing});

        PlaybackState stateAtFinish = PlaybackState::Play;
        connect(m_pipeline.get(), &SpeechPipeline::finished, this,
                [this, &stateAtFinish]() { stateAtFinish = m_compositor->state(); });

        m_pipeline->start();
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 1);
        m_sync->playSegment(2);
        QCOMPARE(m_sync->pendingSegment(), 2);

        m_probe->resolve(0, sec(2.0));
        QTRY_VERIFY(m_pipeline->completed());
        QVERIFY(m_pipeline->failed());
        // Playback never started, so the caller sees a failed finish outside Play
        QCOMPARE(stateAtFinish, PlaybackState::Pause);
        QCOMPARE(static_cast<int>(m_pipeline->chapters().size()), 1);
        QCOMPARE(m_sync->pendingSegment(), -1);
        QCOMPARE(m_sync->bufferingState(), m_compositor->bufferingState());

        // Nothing left to wait for
        m_sync->playSegment(2);
        QCOMPARE(m_sync->pendingSegment(), -1);
        QCOMPARE(m_compositor->state(), PlaybackState::Pause);
    }

    void test_text_index_outside_document_ignored() {
        build();
        loadAll();
        m_sync->playFromTextIndex(1000);
        m_sync->playFromTextIndex(-3);
        QCOMPARE(m_compositor->state(), PlaybackState::Pause);
        QCOMPARE(m_sync->pendingSegment(), -1);
    }

    void test_play_from_text_index_starts_at_word() {
        build();
        loadAll();

        // "Hello world" (11) + 9 → "Second part here"[9], inside "part"
        m_sync->playFromTextIndex(11 + 9);

        QCOMPARE(m_compositor->currentTime(), sec(2.0 + 0.3));
        QCOMPARE(m_compositor->state(), PlaybackState::Play);
    }

    void test_play_from_text_index_deferred() {
        build(false);
        m_pipeline->start();
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 1);

        m_sync->playFromTextIndex(11 + 13);
        QCOMPARE(m_sync->pendingSegment(), 1);

        m_probe->resolve(0, sec(2.0));
        QTRY_COMPARE(static_cast<int>(m_probe->requests.size()), 2);
        m_probe->resolve(1, sec(3.5));

        QCOMPARE(m_compositor->currentTime(), sec(2.0 + 0.6));
        QCOMPARE(m_compositor->state(), PlaybackState::Play);
    }

    // ── Scrolling ──

    void test_scroll_requested_while_auto_scrolling() {
        build();
        loadAll();
        QSignalSpy scrolls(m_sync.get(), &NarrationSynchronizer::scrollRequested);
        m_compositor->setCurrentTime(sec(0.1));
        m_sync->updateHighlight();
        QCOMPARE(scrolls.count(), 1);
    }

    void test_user_scroll_while_playing_disables_auto_scroll() {
        build();
        loadAll();
        QSignalSpy changes(m_sync.get(), &NarrationSynchronizer::autoScrollingChanged);
        QSignalSpy scrolls(m_sync.get(), &NarrationSynchronizer::scrollRequested);

        m_sync->userScrolled(ScrollDirection::Down);
        QCOMPARE(changes.count(), 0);

        m_compositor->play();
        m_sync->userScrolled(ScrollDirection::Down);
        QCOMPARE(changes.count(), 1);
        QCOMPARE(changes.at(0).at(0).toBool(), false);
        QCOMPARE(changes.at(0).at(1).value<ScrollDirection>(), ScrollDirection::Down);
        QVERIFY(!m_sync->isAutoScrolling());

        // Same direction again: nothing new to report
        m_sync->userScrolled(ScrollDirection::Down);
        QCOMPARE(changes.count(), 1);
        m_sync->userScrolled(ScrollDirection::Up);
        QCOMPARE(changes.count(), 2);

        int before = scrolls.count();
        m_compositor->setCurrentTime(sec(0.5));
        m_sync->updateHighlight();
        QCOMPARE(scrolls.count(), before);

        m_sync->setAutoScrolling(true);
        QCOMPARE(scrolls.count(), before + 1);
        QVERIFY(m_sync->isAutoScrolling());
    }

    // ── Hover ──

    void test_hover_throttled_leading_and_trailing() {
        build();
        QSignalSpy hovered(m_sync.get(), &NarrationSynchronizer::segmentHovered);

        m_sync->hoverSegment(0);
        m_sync->hoverSegment(1);
        m_sync->hoverSegment(2);
        QCOMPARE(hovered.count(), 1);
        QCOMPARE(hovered.at(0).at(0).toInt(), 0);

        QTRY_COMPARE(hovered.count(), 2);
        QCOMPARE(hovered.at(1).at(0).toInt(), 2);
    }

    // ── Text model ──

    void test_range_spanning_runs() {
        TextSegment s = segment({"Hello ", "wor", "ld!"});
        QVector<RunSpan> runs = mapRangeToRuns(s, TextRange{3, 11});
        QCOMPARE(runs.size(), 3);
        QVERIFY(runs[0] == (RunSpan{0, 3, 6}));
        QVERIFY(runs[1] == (RunSpan{1, 0, 3}));
        QVERIFY(runs[2] == (RunSpan{2, 0, 2}));
        QVERIFY(mapRangeToRuns(s, TextRange{10, 40}).isEmpty());
    }

    void test_plain_text_paragraphs() {
        PlainTextExtractor extractor("First line\nsecond line\n\n  \n\nNext paragraph\r\n\r\nLast");
        std::vector<TextSegment> segments = extractor.extractText();
        QCOMPARE(static_cast<int>(segments.size()), 3);
        QCOMPARE(segments[0].runs, QStringList({"First line\n", "second line"}));
        QCOMPARE(segments[1].text(), QString("Next paragraph"));
        QCOMPARE(segments[2].text(), QString("Last"));
        QCOMPARE(segments[0].length(), 22);
        QCOMPARE(documentLength(segments), 22 + 14 + 4);
        QCOMPARE(documentLength({}), 0);
    }
};

QTEST_MAIN(TestNarrationSynchronizer)
#include "test_narration_synchronizer.moc"
