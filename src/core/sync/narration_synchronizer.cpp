#include "narration_synchronizer.h"

#include "assert_handler.h"
#include "playback/timeline_compositor.h"
#include "speech/speech_pipeline.h"

Q_LOGGING_CATEGORY(lectorSync, "lector.sync")

namespace lector {

NarrationSynchronizer::NarrationSynchronizer(std::vector<TextSegment> segments,
                                             TimelineCompositor* compositor,
                                             SpeechPipeline* pipeline,
                                             const SyncConfig& config,
                                             QObject* parent)
    : QObject(parent)
    , m_segments(std::move(segments))
    , m_compositor(compositor)
    , m_pipeline(pipeline)
    , m_config(config)
    , m_hoverThrottle(config.hoverThrottleMs)
{
    LECTOR_ASSERT(m_compositor, "NarrationSynchronizer requires a compositor");
    LECTOR_ASSERT(m_pipeline, "NarrationSynchronizer requires a pipeline");

    qRegisterMetaType<lector::WordHighlight>();
    qRegisterMetaType<lector::ScrollDirection>();

    m_pollTimer.setInterval(m_config.highlightIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &NarrationSynchronizer::updateHighlight);

    connect(m_compositor, &TimelineCompositor::stateChanged, this, &NarrationSynchronizer::onStateChanged);
    connect(m_compositor, &TimelineCompositor::bufferingStateChanged, this,
            [this](BufferingState state) {
                if (m_pendingSegment < 0) {
                    emit bufferingStateChanged(state);
                }
            });
    connect(m_pipeline, &SpeechPipeline::segmentLoaded, this, &NarrationSynchronizer::onSegmentLoaded);
    connect(m_pipeline, &SpeechPipeline::finished, this, &NarrationSynchronizer::onPipelineFinished);

    if (m_compositor->state() == PlaybackState::Play) {
        m_pollTimer.start();
    }
}

NarrationSynchronizer::~NarrationSynchronizer() = default;

// ============================================================================
// Lookup
// ============================================================================

int NarrationSynchronizer::chapterAtTime(smp::TimeUS time) const
{
    const auto& chapters = m_pipeline->chapters();
    for (size_t i = 0; i < chapters.size(); ++i) {
        if (chapters[i].timeRange.start <= time && time <= chapters[i].timeRange.end) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::optional<ActiveWord> NarrationSynchronizer::wordAtTime(smp::TimeUS time) const
{
    const int chapterIndex = chapterAtTime(time);
    const auto& chapters = m_pipeline->chapters();
    const auto& responses = m_pipeline->responses();
    if (chapterIndex < 0 || chapterIndex >= static_cast<int>(responses.size())) {
        return std::nullopt;
    }

    const Chapter& chapter = chapters[static_cast<size_t>(chapterIndex)];
    const smp::TimeUS relative = time - chapter.timeRange.start;
    for (const WordTimestamp& word : responses[static_cast<size_t>(chapterIndex)].wordTimestamps) {
        if (word.timeRange.contains(relative)) {
            ActiveWord active;
            active.segment = chapterIndex;
            active.textRange = word.textRange;
            active.startTime = chapter.timeRange.start + word.timeRange.start;
            return active;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Highlight
// ============================================================================

void NarrationSynchronizer::updateHighlight()
{
    const smp::TimeUS time = m_compositor->currentTime();
    std::optional<ActiveWord> word = wordAtTime(time);
    if (!word) {
        return;
    }

    if (m_lastWord && m_lastWord->segment == word->segment && m_lastWord->textRange == word->textRange) {
        return;
    }

    if (word->segment >= static_cast<int>(m_segments.size())) {
        qCDebug(lectorSync, "No text segment %d for word at %lld", word->segment,
                static_cast<long long>(time));
        return;
    }
    QVector<RunSpan> runs = mapRangeToRuns(m_segments[static_cast<size_t>(word->segment)], word->textRange);
    if (runs.isEmpty()) {
        qCDebug(lectorSync, "Word [%d, %d) outside segment %d", word->textRange.start,
                word->textRange.end, word->segment);
        return;
    }

    m_lastWord = word;
    m_highlight.segment = word->segment;
    m_highlight.textRange = word->textRange;
    m_highlight.runs = runs;

    emit wordHighlighted(m_highlight);
    if (m_autoScrolling) {
        emit scrollRequested(m_highlight);
    }
}

void NarrationSynchronizer::clearHighlight()
{
    m_lastWord.reset();
    m_highlight = WordHighlight();
    emit highlightCleared();
}

void NarrationSynchronizer::onStateChanged(PlaybackState state)
{
    if (state == PlaybackState::Ended) {
        clearHighlight();
    }

    if (state == PlaybackState::Play) {
        updateHighlight();
        m_pollTimer.start();
    } else {
        m_pollTimer.stop();
    }

    // Any intent change supersedes a deferred play request
    if (m_pendingSegment >= 0) {
        m_pendingSegment = -1;
        emit bufferingStateChanged(bufferingState());
    }
}

// ============================================================================
// Play from position
// ============================================================================

void NarrationSynchronizer::playSegment(int index)
{
    if (index < 0 || index >= static_cast<int>(m_segments.size())) {
        return;
    }
    startAt(index, -1);
}

void NarrationSynchronizer::playFromTextIndex(int characterOffset)
{
    int segmentStart = 0;
    for (size_t i = 0; i < m_segments.size(); ++i) {
        const int length = m_segments[i].length();
        if (characterOffset >= segmentStart && characterOffset < segmentStart + length) {
            startAt(static_cast<int>(i), characterOffset - segmentStart);
            return;
        }
        segmentStart += length;
    }
    qCWarning(lectorSync, "Text index %d is outside the document (%d chars)", characterOffset, segmentStart);
}

smp::TimeUS NarrationSynchronizer::resolveStart(int segment, int localOffset) const
{
    const Chapter& chapter = m_pipeline->chapters()[static_cast<size_t>(segment)];
    if (localOffset < 0) {
        return chapter.timeRange.start;
    }

    const auto& responses = m_pipeline->responses();
    if (segment >= static_cast<int>(responses.size())) {
        return chapter.timeRange.start;
    }
    for (const WordTimestamp& word : responses[static_cast<size_t>(segment)].wordTimestamps) {
        if (word.textRange.end > localOffset) {
            return chapter.timeRange.start + word.timeRange.start;
        }
    }
    return chapter.timeRange.start;
}

void NarrationSynchronizer::startAt(int segment, int localOffset)
{
    if (segment >= static_cast<int>(m_pipeline->chapters().size())) {
        if (m_pipeline->completed()) {
            qCWarning(lectorSync, "Stream is finished, cannot play segment %d", segment);
            return;
        }
        defer(segment, localOffset);
        return;
    }

    smp::TimeUS start = resolveStart(segment, localOffset);
    qCDebug(lectorSync, "Playing segment %d from %lld", segment, static_cast<long long>(start));
    m_compositor->setCurrentTime(start);
    m_compositor->play();
}

void NarrationSynchronizer::defer(int segment, int localOffset)
{
    m_compositor->pause();

    qCDebug(lectorSync, "Segment %d not loaded yet, waiting", segment);
    m_pendingSegment = segment;
    m_pendingOffset = localOffset;
    emit bufferingStateChanged(BufferingState::Buffering);
}

void NarrationSynchronizer::onSegmentLoaded(int)
{
    if (m_pendingSegment < 0) {
        return;
    }
    const int segment = m_pendingSegment;
    const int offset = m_pendingOffset;
    if (segment >= static_cast<int>(m_pipeline->chapters().size())) {
        return;
    }

    m_pendingSegment = -1;
    startAt(segment, offset);
    if (m_pendingSegment < 0) {
        emit bufferingStateChanged(bufferingState());
    }
}

void NarrationSynchronizer::onPipelineFinished()
{
    if (m_pendingSegment < 0) {
        return;
    }
    qCWarning(lectorSync, "Narration ended without segment %d", m_pendingSegment);
    m_pendingSegment = -1;
    emit bufferingStateChanged(bufferingState());
}

BufferingState NarrationSynchronizer::bufferingState() const
{
    if (m_pendingSegment >= 0) {
        return BufferingState::Buffering;
    }
    return m_compositor->bufferingState();
}

// ============================================================================
// Scrolling / hover
// ============================================================================

void NarrationSynchronizer::setAutoScrolling(bool enabled)
{
    m_autoScrolling = enabled;
    if (enabled && m_highlight.segment >= 0) {
        emit scrollRequested(m_highlight);
    }
    emit autoScrollingChanged(enabled, ScrollDirection::Up);
}

void NarrationSynchronizer::userScrolled(ScrollDirection direction)
{
    if (m_compositor->state() != PlaybackState::Play) {
        return;
    }
    if (m_autoScrolling || m_lastDirection != direction) {
        m_lastDirection = direction;
        m_autoScrolling = false;
        emit autoScrollingChanged(false, direction);
    }
}

void NarrationSynchronizer::hoverSegment(int index)
{
    if (index < 0 || index >= static_cast<int>(m_segments.size())) {
        return;
    }
    m_hoverThrottle.call([this, index]() { emit segmentHovered(index); });
}

} // namespace lector
