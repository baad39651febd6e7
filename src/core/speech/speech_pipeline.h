#pragma once

#include "byte_stream.h"
#include "segment_source.h"
#include "speech_service.h"
#include "speech_types.h"

#include <stream_media_platform/smp_time.h>

#include <QObject>

#include <cstdint>
#include <memory>
#include <vector>

namespace lector {

class TimelineCompositor;

struct PipelineConfig {
    int maxAttempts = 3;
};

// Span of one source segment on the virtual timeline
struct Chapter {
    smp::TimeSpan timeRange;
};

/**
 * SpeechPipeline: text segments → speech requests → timeline chunks.
 *
 * Strictly sequential: one request in flight, the next segment is pulled
 * only after the previous chunk registered. Each response body is drained
 * in full and submitted as a single chunk; an empty body yields an empty
 * chapter. Failed attempts retry with the same text up to maxAttempts;
 * exhaustion stops the pipeline and ends the timeline input.
 */
class SpeechPipeline : public QObject
{
    Q_OBJECT

public:
    SpeechPipeline(std::unique_ptr<SegmentSource> source,
                   SpeechService* service,
                   TimelineCompositor* compositor,
                   const PipelineConfig& config = PipelineConfig(),
                   QObject* parent = nullptr);
    ~SpeechPipeline() override;

    void start();

    // Abort the in-flight request and drop remaining segments
    void dispose();

    const std::vector<Chapter>& chapters() const { return m_chapters; }
    const std::vector<TtsResponse>& responses() const { return m_responses; }

    // Every segment processed, or the pipeline failed
    bool completed() const { return m_completed; }
    bool failed() const { return m_failed; }

signals:
    void segmentLoaded(int index);
    void finished();
    void errorOccurred(const smp::Error& error);

private:
    void scheduleNext();
    void requestNext();
    void issueAttempt();
    void onReply(smp::Result<SpeechReply> result);
    void onDrained(const QByteArray& data);
    void attemptFailed(const smp::Error& error);
    void pushChapter(smp::TimeUS start, smp::TimeUS end);
    void discardBody();
    void complete();
    void fail(const smp::Error& error);

    std::unique_ptr<SegmentSource> m_source;
    SpeechService* m_service;
    TimelineCompositor* m_compositor;
    PipelineConfig m_config;

    QString m_text;
    int m_segmentIndex = -1;
    int m_attempt = 0;
    uint64_t m_generation = 0;

    std::unique_ptr<SpeechRequest> m_request;
    SpeechReply m_reply;
    std::unique_ptr<ByteStreamDrain> m_drain;

    std::vector<Chapter> m_chapters;
    std::vector<TtsResponse> m_responses;

    bool m_started = false;
    bool m_completed = false;
    bool m_failed = false;
    bool m_disposed = false;
};

} // namespace lector
