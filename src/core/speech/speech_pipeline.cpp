#include "speech_pipeline.h"

#include "assert_handler.h"
#include "playback/timeline_compositor.h"

#include <QTimer>

Q_LOGGING_CATEGORY(lectorSpeech, "lector.speech")

namespace lector {

SpeechPipeline::SpeechPipeline(std::unique_ptr<SegmentSource> source,
                               SpeechService* service,
                               TimelineCompositor* compositor,
                               const PipelineConfig& config,
                               QObject* parent)
    : QObject(parent)
    , m_source(std::move(source))
    , m_service(service)
    , m_compositor(compositor)
    , m_config(config)
{
    LECTOR_ASSERT(m_source, "SpeechPipeline requires a segment source");
    LECTOR_ASSERT(m_service, "SpeechPipeline requires a speech service");
    LECTOR_ASSERT(m_compositor, "SpeechPipeline requires a compositor");
    if (m_config.maxAttempts < 1) {
        m_config.maxAttempts = 1;
    }
}

SpeechPipeline::~SpeechPipeline()
{
    dispose();
}

void SpeechPipeline::start()
{
    if (m_started || m_disposed) {
        return;
    }
    m_started = true;
    requestNext();
}

void SpeechPipeline::dispose()
{
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    ++m_generation;

    if (m_drain) {
        m_drain->abort();
    }
    if (m_request) {
        m_request->abort();
    }
    discardBody();
    qCDebug(lectorSpeech, "Pipeline disposed after %d chapters", static_cast<int>(m_chapters.size()));
}

void SpeechPipeline::scheduleNext()
{
    const uint64_t generation = m_generation;
    QTimer::singleShot(0, this, [this, generation]() {
        if (generation == m_generation && !m_disposed) {
            requestNext();
        }
    });
}

void SpeechPipeline::requestNext()
{
    QString text;
    if (!m_source->next(&text)) {
        complete();
        return;
    }
    m_text = text;
    ++m_segmentIndex;
    m_attempt = 0;
    issueAttempt();
}

void SpeechPipeline::issueAttempt()
{
    ++m_attempt;
    const uint64_t generation = ++m_generation;
    qCDebug(lectorSpeech, "Requesting speech for segment %d (attempt %d/%d, %d chars)",
            m_segmentIndex, m_attempt, m_config.maxAttempts, static_cast<int>(m_text.size()));

    // The service may answer synchronously
    std::unique_ptr<SpeechRequest> request = m_service->createSpeech(
        m_text, [this, generation](smp::Result<SpeechReply> result) {
            if (generation != m_generation || m_disposed) {
                return;
            }
            onReply(std::move(result));
        });
    if (generation == m_generation) {
        m_request = std::move(request);
    }
}

void SpeechPipeline::onReply(smp::Result<SpeechReply> result)
{
    if (result.is_error()) {
        attemptFailed(result.error());
        return;
    }

    m_reply = std::move(result.value());
    if (!m_reply.body) {
        onDrained(QByteArray());
        return;
    }

    const uint64_t generation = m_generation;
    m_drain = std::make_unique<ByteStreamDrain>(m_reply.body.get());
    connect(m_drain.get(), &ByteStreamDrain::drained, this, [this, generation](const QByteArray& data) {
        if (generation == m_generation) {
            onDrained(data);
        }
    });
    connect(m_drain.get(), &ByteStreamDrain::failed, this, [this, generation](const smp::Error& error) {
        if (generation == m_generation) {
            attemptFailed(error);
        }
    });
    m_drain->start();
}

void SpeechPipeline::onDrained(const QByteArray& data)
{
    TtsResponse response;
    response.text = m_text;
    response.contentType = m_reply.contentType;
    response.content = data;
    response.wordTimestamps = std::move(m_reply.wordTimestamps);
    m_responses.push_back(std::move(response));
    discardBody();

    qCDebug(lectorSpeech, "Segment %d drained: %lld bytes, %d words", m_segmentIndex,
            static_cast<long long>(data.size()),
            static_cast<int>(m_responses.back().wordTimestamps.size()));

    if (data.isEmpty()) {
        smp::TimeUS start = m_chapters.empty() ? 0 : m_chapters.back().timeRange.end;
        pushChapter(start, start);
        scheduleNext();
        return;
    }

    const uint64_t generation = m_generation;
    m_compositor->next(m_responses.back().contentType, data,
                       [this, generation](int, const AudioChunk& chunk) {
                           if (generation != m_generation || m_disposed) {
                               return;
                           }
                           pushChapter(chunk.span.start, chunk.span.end);
                           scheduleNext();
                       });
}

void SpeechPipeline::attemptFailed(const smp::Error& error)
{
    discardBody();

    if (m_attempt < m_config.maxAttempts) {
        qCWarning(lectorSpeech, "Failed to create speech: %s. Retrying %d/%d...",
                  error.describe().c_str(), m_attempt, m_config.maxAttempts);
        const uint64_t generation = m_generation;
        QTimer::singleShot(0, this, [this, generation]() {
            if (generation == m_generation && !m_disposed) {
                issueAttempt();
            }
        });
        return;
    }
    fail(error);
}

void SpeechPipeline::pushChapter(smp::TimeUS start, smp::TimeUS end)
{
    Chapter chapter;
    chapter.timeRange.start = start;
    chapter.timeRange.end = end;
    m_chapters.push_back(chapter);

    const int index = static_cast<int>(m_chapters.size()) - 1;
    qCDebug(lectorSpeech, "Chapter %d: [%lld, %lld)", index,
            static_cast<long long>(start), static_cast<long long>(end));
    emit segmentLoaded(index);
}

void SpeechPipeline::discardBody()
{
    // Either may be mid-emission
    if (m_drain) {
        m_drain.release()->deleteLater();
    }
    if (m_reply.body) {
        m_reply.body.release()->deleteLater();
    }
}

void SpeechPipeline::complete()
{
    m_completed = true;
    qCInfo(lectorSpeech, "All %d segments loaded", static_cast<int>(m_chapters.size()));
    m_compositor->end();
    emit finished();
}

void SpeechPipeline::fail(const smp::Error& error)
{
    m_failed = true;
    m_completed = true;
    ++m_generation;
    qCCritical(lectorSpeech, "Speech pipeline failed at segment %d: %s", m_segmentIndex,
               error.describe().c_str());
    m_compositor->end();
    emit errorOccurred(error);
    emit finished();
}

} // namespace lector
