#pragma once

#include "chunk_playback.h"
#include "duration_probe.h"
#include "media_controller.h"
#include "playback_types.h"

#include <QByteArray>
#include <QList>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QObject>
#include <QString>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(lectorCompositor)

namespace lector {

/**
 * TimelineCompositor: presents independently decoded chunks as one
 * seekable virtual timeline.
 *
 * Chunks arrive through next(), are measured by the DurationProbe and
 * registered in submission order at the running duration. Each chunk gets
 * a lazily created playback record (handle + controller). At most one
 * record is active: the one whose span contains the cursor.
 *
 * Cursor outside every registered chunk:
 * - input still open: Buffering, resumed when a covering chunk arrives
 * - input ended: Ended, cursor clamped to the final duration
 *
 * Preferred state lives here; the active record's controller only mirrors
 * it. Notifications from inactive records are discarded.
 */
class TimelineCompositor : public QObject
{
    Q_OBJECT

public:
    using RegisteredFn = std::function<void(int index, const AudioChunk& chunk)>;

    TimelineCompositor(std::unique_ptr<ChunkPlaybackFactory> factory,
                       std::unique_ptr<DurationProbe> probe,
                       QObject* parent = nullptr);
    ~TimelineCompositor() override;

    // Measure and register a chunk. onRegistered runs once it is placed.
    void next(const QString& mimeType, const QByteArray& bytes, RegisteredFn onRegistered = RegisteredFn());

    // No more chunks. Takes effect after pending measurements register.
    void end();
    bool isInputEnded() const { return m_inputEnded; }

    smp::TimeUS duration() const { return m_runningDuration; }
    smp::TimeUS currentTime() const;
    void setCurrentTime(smp::TimeUS time);

    void play();
    void pause();
    void setState(PlaybackState state);
    PlaybackState state() const { return m_state; }
    BufferingState bufferingState() const { return m_buffering; }

    double volume() const { return m_volume; }
    void setVolume(double volume);

    int chunkCount() const { return static_cast<int>(m_records.size()); }
    const AudioChunk& chunk(int index) const;
    int activeIndex() const { return m_active; }
    int pendingMeasurements() const { return static_cast<int>(m_pending.size()); }

    // Index of the chunk containing time, -1 when none does
    int find(smp::TimeUS time) const;

    // Release every record. The compositor is inert afterwards.
    void dispose();

signals:
    void stateChanged(lector::PlaybackState state);
    void bufferingStateChanged(lector::BufferingState state);
    void timeUpdated(qint64 time);
    void durationChanged(qint64 duration);
    void chunkRegistered(int index, qint64 start, qint64 end);
    void inputEnded();
    void seeking(qint64 time);

private:
    struct PendingChunk {
        uint64_t seq = 0;
        QString mimeType;
        QByteArray bytes;
        RegisteredFn onRegistered;
        bool measured = false;
        smp::TimeUS duration = 0;
    };

    struct ChunkRecord {
        AudioChunk chunk;
        ChunkPlayback playback;
        std::unique_ptr<MediaController> controller;
        QList<QMetaObject::Connection> bindings;
    };

    void onMeasured(uint64_t seq, smp::TimeUS duration);
    void registerChunk(PendingChunk& pending);
    void finishInput();
    void maybeResume();

    ChunkRecord& ensureRecord(int index);
    void activate(int index);
    void detachActive();
    void handoff(int index);

    void onRecordState(int index, PlaybackState state);
    void onRecordBuffering(int index, bool buffering);
    void onRecordTime(int index, qint64 localTime);

    void storeState(PlaybackState state);
    void setBuffering(BufferingState state);

    std::unique_ptr<ChunkPlaybackFactory> m_factory;
    std::unique_ptr<DurationProbe> m_probe;

    std::vector<std::unique_ptr<ChunkRecord>> m_records;
    std::deque<PendingChunk> m_pending;
    uint64_t m_nextSeq = 1;

    smp::TimeUS m_runningDuration = 0;
    smp::TimeUS m_cursor = 0;
    int m_active = -1;

    PlaybackState m_state = PlaybackState::Pause;
    BufferingState m_buffering = BufferingState::Buffering;
    double m_volume = 1.0;

    bool m_endRequested = false;
    bool m_inputEnded = false;
    bool m_disposed = false;
};

} // namespace lector
