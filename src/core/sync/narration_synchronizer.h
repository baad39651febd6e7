#pragma once

#include "text_segment.h"

#include "common/throttle.h"
#include "playback/playback_types.h"

#include <stream_media_platform/smp_time.h>

#include <QLoggingCategory>
#include <QObject>
#include <QTimer>

#include <optional>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(lectorSync)

namespace lector {

class SpeechPipeline;
class TimelineCompositor;

struct SyncConfig {
    int highlightIntervalMs = 16;
    int hoverThrottleMs = 33;
};

// Where the highlight sits relative to the viewport
enum class ScrollDirection {
    Up,
    Down
};

struct ActiveWord {
    int segment = -1;
    TextRange textRange;
    smp::TimeUS startTime = 0;  // virtual timeline
};

/**
 * NarrationSynchronizer: maps the playback cursor back onto the text.
 *
 * While the compositor plays, the cursor is polled every frame; the word
 * under it is looked up in the chapter's word table and announced when it
 * changes. Also resolves "play from here" requests for segments whose
 * audio does not exist yet: playback pauses, reports Buffering and jumps
 * to the segment once its chapter arrives.
 */
class NarrationSynchronizer : public QObject
{
    Q_OBJECT

public:
    NarrationSynchronizer(std::vector<TextSegment> segments,
                          TimelineCompositor* compositor,
                          SpeechPipeline* pipeline,
                          const SyncConfig& config = SyncConfig(),
                          QObject* parent = nullptr);
    ~NarrationSynchronizer() override;

    const std::vector<TextSegment>& segments() const { return m_segments; }

    // First chapter with start <= time <= end, -1 when none
    int chapterAtTime(smp::TimeUS time) const;
    std::optional<ActiveWord> wordAtTime(smp::TimeUS time) const;

    void playSegment(int index);
    void playFromTextIndex(int characterOffset);
    int pendingSegment() const { return m_pendingSegment; }

    // Buffering while a deferred play request waits for its chapter
    BufferingState bufferingState() const;

    // One highlight poll at the current cursor
    void updateHighlight();
    const WordHighlight& currentHighlight() const { return m_highlight; }

    void setAutoScrolling(bool enabled);
    bool isAutoScrolling() const { return m_autoScrolling; }
    // A scroll the user made; direction is where the highlight now lies
    void userScrolled(ScrollDirection direction);
    ScrollDirection scrollDirection() const { return m_lastDirection; }

    void hoverSegment(int index);

signals:
    void wordHighlighted(const lector::WordHighlight& highlight);
    void highlightCleared();
    void scrollRequested(const lector::WordHighlight& highlight);
    void bufferingStateChanged(lector::BufferingState state);
    void autoScrollingChanged(bool enabled, lector::ScrollDirection direction);
    void segmentHovered(int index);

private:
    void onStateChanged(PlaybackState state);
    void onSegmentLoaded(int index);
    void onPipelineFinished();

    // Virtual time for a character offset within a loaded segment
    smp::TimeUS resolveStart(int segment, int localOffset) const;
    void startAt(int segment, int localOffset);
    void defer(int segment, int localOffset);
    void clearHighlight();

    std::vector<TextSegment> m_segments;
    TimelineCompositor* m_compositor;
    SpeechPipeline* m_pipeline;
    SyncConfig m_config;

    QTimer m_pollTimer;
    Throttle m_hoverThrottle;

    std::optional<ActiveWord> m_lastWord;
    WordHighlight m_highlight;

    int m_pendingSegment = -1;
    int m_pendingOffset = 0;

    bool m_autoScrolling = true;
    ScrollDirection m_lastDirection = ScrollDirection::Up;
};

} // namespace lector

Q_DECLARE_METATYPE(lector::ScrollDirection)
