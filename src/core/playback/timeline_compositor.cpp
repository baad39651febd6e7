#include "timeline_compositor.h"

#include "assert_handler.h"

#include <algorithm>

Q_LOGGING_CATEGORY(lectorCompositor, "lector.compositor")

namespace lector {

TimelineCompositor::TimelineCompositor(std::unique_ptr<ChunkPlaybackFactory> factory,
                                       std::unique_ptr<DurationProbe> probe,
                                       QObject* parent)
    : QObject(parent)
    , m_factory(std::move(factory))
    , m_probe(std::move(probe))
{
    LECTOR_ASSERT(m_factory, "TimelineCompositor requires a playback factory");
    LECTOR_ASSERT(m_probe, "TimelineCompositor requires a duration probe");

    qRegisterMetaType<lector::PlaybackState>();
    qRegisterMetaType<lector::BufferingState>();
}

TimelineCompositor::~TimelineCompositor()
{
    dispose();
}

// ============================================================================
// Input
// ============================================================================

void TimelineCompositor::next(const QString& mimeType, const QByteArray& bytes, RegisteredFn onRegistered)
{
    if (m_disposed) {
        return;
    }
    LECTOR_ASSERT(!m_endRequested, "TimelineCompositor::next() after end()");

    PendingChunk pending;
    pending.seq = m_nextSeq++;
    pending.mimeType = mimeType;
    pending.bytes = bytes;
    pending.onRegistered = std::move(onRegistered);
    const uint64_t seq = pending.seq;
    m_pending.push_back(std::move(pending));

    qCDebug(lectorCompositor, "Measuring chunk #%llu (%lld bytes, %s)",
            static_cast<unsigned long long>(seq), static_cast<long long>(bytes.size()),
            qPrintable(mimeType));

    // The probe may call back synchronously
    m_probe->measure(mimeType, bytes, [this, seq](smp::TimeUS duration) {
        onMeasured(seq, duration);
    });
}

void TimelineCompositor::end()
{
    if (m_disposed || m_endRequested) {
        return;
    }
    m_endRequested = true;
    if (m_pending.empty()) {
        finishInput();
    }
}

void TimelineCompositor::onMeasured(uint64_t seq, smp::TimeUS duration)
{
    if (m_disposed) {
        return;
    }

    auto it = std::find_if(m_pending.begin(), m_pending.end(),
                           [seq](const PendingChunk& p) { return p.seq == seq; });
    if (it == m_pending.end()) {
        return;
    }
    it->measured = true;
    it->duration = std::max<smp::TimeUS>(0, duration);

    // Algorithm: register the measured prefix in submission order
    while (!m_pending.empty() && m_pending.front().measured) {
        PendingChunk front = std::move(m_pending.front());
        m_pending.pop_front();
        registerChunk(front);
        if (m_disposed) {
            return;
        }
    }

    if (m_endRequested && m_pending.empty()) {
        finishInput();
    }
}

void TimelineCompositor::registerChunk(PendingChunk& pending)
{
    auto record = std::make_unique<ChunkRecord>();
    record->chunk.mimeType = pending.mimeType;
    record->chunk.bytes = std::move(pending.bytes);
    record->chunk.span.start = m_runningDuration;
    record->chunk.span.end = m_runningDuration + pending.duration;

    m_runningDuration = record->chunk.span.end;
    m_records.push_back(std::move(record));

    const int index = chunkCount() - 1;
    const AudioChunk& registered = m_records.back()->chunk;
    qCDebug(lectorCompositor, "Registered chunk %d: [%lld, %lld)", index,
            static_cast<long long>(registered.span.start),
            static_cast<long long>(registered.span.end));

    emit durationChanged(m_runningDuration);
    emit chunkRegistered(index, registered.span.start, registered.span.end);
    if (pending.onRegistered) {
        pending.onRegistered(index, registered);
    }

    maybeResume();
}

void TimelineCompositor::finishInput()
{
    if (m_inputEnded) {
        return;
    }
    m_inputEnded = true;
    qCInfo(lectorCompositor, "Input ended, total duration %lld us", static_cast<long long>(m_runningDuration));
    emit inputEnded();

    if (m_active < 0 && find(m_cursor) < 0) {
        m_cursor = std::min(m_cursor, m_runningDuration);
        if (m_cursor >= m_runningDuration) {
            emit timeUpdated(m_cursor);
            storeState(PlaybackState::Ended);
        }
        setBuffering(BufferingState::Ready);
    }
}

void TimelineCompositor::maybeResume()
{
    if (m_active >= 0) {
        return;
    }
    int index = find(m_cursor);
    if (index < 0) {
        return;
    }

    if (m_state == PlaybackState::Play) {
        qCDebug(lectorCompositor, "Chunk %d covers waiting cursor %lld, resuming", index,
                static_cast<long long>(m_cursor));
        activate(index);
        return;
    }
    // Paused: the record stays lazy until play or seek
    setBuffering(BufferingState::Ready);
}

// ============================================================================
// Cursor
// ============================================================================

int TimelineCompositor::find(smp::TimeUS time) const
{
    auto it = std::upper_bound(m_records.begin(), m_records.end(), time,
                               [](smp::TimeUS t, const std::unique_ptr<ChunkRecord>& r) {
                                   return t < r->chunk.span.start;
                               });
    if (it == m_records.begin()) {
        return -1;
    }
    --it;
    if (!(*it)->chunk.span.contains(time)) {
        return -1;
    }
    return static_cast<int>(it - m_records.begin());
}

const AudioChunk& TimelineCompositor::chunk(int index) const
{
    LECTOR_ASSERT(index >= 0 && index < chunkCount(), "TimelineCompositor::chunk index out of range");
    return m_records[static_cast<size_t>(index)]->chunk;
}

smp::TimeUS TimelineCompositor::currentTime() const
{
    if (m_active < 0) {
        return m_cursor;
    }
    const ChunkRecord& record = *m_records[static_cast<size_t>(m_active)];
    smp::TimeUS local = std::clamp<smp::TimeUS>(record.controller->currentTime(), 0,
                                                record.chunk.span.duration());
    return record.chunk.span.start + local;
}

void TimelineCompositor::setCurrentTime(smp::TimeUS time)
{
    if (m_disposed) {
        return;
    }
    time = std::max<smp::TimeUS>(0, time);
    emit seeking(time);

    if (m_inputEnded && time >= m_runningDuration) {
        qCDebug(lectorCompositor, "Seek to %lld past final duration, clamping", static_cast<long long>(time));
        detachActive();
        m_cursor = m_runningDuration;
        emit timeUpdated(m_cursor);
        storeState(PlaybackState::Ended);
        setBuffering(BufferingState::Ready);
        return;
    }

    int index = find(time);
    if (index < 0) {
        qCDebug(lectorCompositor, "Seek to %lld beyond registered chunks, waiting", static_cast<long long>(time));
        detachActive();
        m_cursor = time;
        emit timeUpdated(m_cursor);
        setBuffering(BufferingState::Buffering);
        return;
    }

    if (m_state == PlaybackState::Ended) {
        storeState(PlaybackState::Pause);
    }

    if (index == m_active) {
        ChunkRecord& record = *m_records[static_cast<size_t>(index)];
        record.controller->setCurrentTime(time - record.chunk.span.start);
    } else {
        detachActive();
        m_cursor = time;
        activate(index);
    }
    emit timeUpdated(time);
}

// ============================================================================
// Intent
// ============================================================================

void TimelineCompositor::play()
{
    if (m_disposed) {
        return;
    }
    if (m_state == PlaybackState::Ended) {
        qCDebug(lectorCompositor, "play() from Ended, restarting");
        setCurrentTime(0);
    }
    storeState(PlaybackState::Play);

    if (m_active >= 0) {
        m_records[static_cast<size_t>(m_active)]->controller->play();
        return;
    }
    int index = find(m_cursor);
    if (index >= 0) {
        activate(index);
    } else if (!m_inputEnded) {
        setBuffering(BufferingState::Buffering);
    }
}

void TimelineCompositor::pause()
{
    if (m_state == PlaybackState::Ended) {
        return;
    }
    storeState(PlaybackState::Pause);
    if (m_active >= 0) {
        m_records[static_cast<size_t>(m_active)]->controller->pause();
    }
}

void TimelineCompositor::setState(PlaybackState state)
{
    if (state == m_state) {
        return;
    }
    switch (state) {
    case PlaybackState::Play:
        play();
        return;
    case PlaybackState::Pause:
        pause();
        return;
    case PlaybackState::Ended:
        storeState(state);
        if (m_active >= 0) {
            m_records[static_cast<size_t>(m_active)]->controller->pause();
        }
        return;
    }
}

void TimelineCompositor::setVolume(double volume)
{
    m_volume = std::clamp(volume, 0.0, 1.0);
    for (auto& record : m_records) {
        if (record->controller) {
            record->controller->setVolume(m_volume);
        }
    }
}

// ============================================================================
// Records
// ============================================================================

TimelineCompositor::ChunkRecord& TimelineCompositor::ensureRecord(int index)
{
    ChunkRecord& record = *m_records[static_cast<size_t>(index)];
    if (record.controller) {
        return record;
    }

    qCDebug(lectorCompositor, "Creating playback record for chunk %d", index);
    record.playback = m_factory->create(record.chunk);
    LECTOR_ASSERT(record.playback.handle, "ChunkPlaybackFactory returned no handle");

    record.controller = std::make_unique<MediaController>(record.playback.handle.get());
    record.controller->setVolume(m_volume);

    if (record.playback.appender) {
        connect(record.playback.appender.get(), &ChunkBufferAppender::errorOccurred, this,
                [index](const smp::Error& error) {
                    qCWarning(lectorCompositor, "Chunk %d buffer error: %s", index, error.describe().c_str());
                });
    }
    return record;
}

void TimelineCompositor::activate(int index)
{
    LECTOR_ASSERT(m_active < 0, "TimelineCompositor::activate with a record still bound");

    ChunkRecord& record = ensureRecord(index);
    m_active = index;

    MediaController* controller = record.controller.get();
    record.bindings << connect(controller, &MediaController::stateChanged, this,
                               [this, index](PlaybackState s) { onRecordState(index, s); });
    record.bindings << connect(controller, &MediaController::bufferingStateChanged, this,
                               [this, index](bool b) { onRecordBuffering(index, b); });
    record.bindings << connect(controller, &MediaController::timeUpdated, this,
                               [this, index](qint64 t) { onRecordTime(index, t); });

    qCDebug(lectorCompositor, "Active chunk %d at local %lld", index,
            static_cast<long long>(m_cursor - record.chunk.span.start));

    controller->setCurrentTime(m_cursor - record.chunk.span.start);
    setBuffering(controller->isBuffering() ? BufferingState::Buffering : BufferingState::Ready);

    if (m_state == PlaybackState::Play) {
        controller->play();
    } else {
        controller->pause();
    }
}

void TimelineCompositor::detachActive()
{
    if (m_active < 0) {
        return;
    }
    m_cursor = currentTime();

    ChunkRecord& record = *m_records[static_cast<size_t>(m_active)];
    for (const auto& binding : record.bindings) {
        disconnect(binding);
    }
    record.bindings.clear();
    record.controller->pause();
    m_active = -1;
}

void TimelineCompositor::handoff(int index)
{
    const smp::TimeUS end = m_records[static_cast<size_t>(index)]->chunk.span.end;
    detachActive();
    m_cursor = end;
    emit timeUpdated(m_cursor);

    int nextIndex = find(m_cursor);
    if (nextIndex >= 0) {
        qCDebug(lectorCompositor, "Chunk %d ended, handing off to %d", index, nextIndex);
        activate(nextIndex);
        return;
    }

    if (m_inputEnded && m_cursor >= m_runningDuration) {
        qCInfo(lectorCompositor, "Timeline ended at %lld", static_cast<long long>(m_cursor));
        storeState(PlaybackState::Ended);
        setBuffering(BufferingState::Ready);
        return;
    }

    qCDebug(lectorCompositor, "Chunk %d ended, waiting for more input", index);
    setBuffering(BufferingState::Buffering);
}

void TimelineCompositor::onRecordState(int index, PlaybackState state)
{
    if (index != m_active) {
        return;
    }
    if (state == PlaybackState::Ended) {
        handoff(index);
        return;
    }
    // Policy refusal reverted the record: mirror it
    if (state == PlaybackState::Pause && m_state == PlaybackState::Play) {
        storeState(PlaybackState::Pause);
    }
}

void TimelineCompositor::onRecordBuffering(int index, bool buffering)
{
    if (index != m_active) {
        return;
    }
    setBuffering(buffering ? BufferingState::Buffering : BufferingState::Ready);
}

void TimelineCompositor::onRecordTime(int index, qint64 localTime)
{
    if (index != m_active) {
        return;
    }
    const AudioChunk& c = m_records[static_cast<size_t>(index)]->chunk;
    emit timeUpdated(c.span.start + std::clamp<smp::TimeUS>(localTime, 0, c.span.duration()));
}

// ============================================================================
// State
// ============================================================================

void TimelineCompositor::storeState(PlaybackState state)
{
    if (state == m_state) {
        return;
    }
    qCDebug(lectorCompositor, "State %s → %s", playbackStateName(m_state), playbackStateName(state));
    m_state = state;
    emit stateChanged(state);
}

void TimelineCompositor::setBuffering(BufferingState state)
{
    if (state == m_buffering) {
        return;
    }
    m_buffering = state;
    emit bufferingStateChanged(state);
}

void TimelineCompositor::dispose()
{
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    detachActive();
    m_pending.clear();

    for (auto& record : m_records) {
        if (!record->controller) {
            continue;
        }
        record->controller->pause();
        if (record->playback.appender) {
            record->playback.appender->end();
        }
        record->controller.reset();
        record->playback.appender.reset();
        record->playback.handle.reset();
    }
    qCDebug(lectorCompositor, "Disposed %d chunk records", chunkCount());
}

} // namespace lector
