#pragma once

#include "smp_audio.h"
#include "smp_errors.h"
#include "smp_time.h"

#include <QByteArray>
#include <QFutureWatcher>
#include <QMetaType>
#include <QObject>

#include <cstdint>
#include <memory>
#include <vector>

namespace smp {

// Append-only media buffer fed with encoded chunks.
// Mutations (AppendBuffer, Remove) complete asynchronously: Updating() is
// true until updateEnded or updateFailed fires. Capacity and state
// violations are reported synchronously by the mutating call.
class SourceBuffer : public QObject {
    Q_OBJECT

public:
    explicit SourceBuffer(QObject* parent = nullptr) : QObject(parent) {}
    ~SourceBuffer() override = default;

    virtual bool Updating() const = 0;

    // QuotaExceeded when retained data plus bytes exceeds capacity,
    // InvalidState while updating or after EndOfStream
    virtual Result<void> AppendBuffer(const QByteArray& bytes, const QString& mime_type) = 0;

    // Drop media in [start, end)
    virtual Result<void> Remove(TimeUS start, TimeUS end) = 0;

    // Retained ranges, sorted, contiguous ranges merged
    virtual std::vector<TimeSpan> Buffered() const = 0;

    // Cancel the in-flight mutation; its completion is never signalled
    virtual void Abort() = 0;

    virtual void EndOfStream() = 0;
    virtual bool Ended() const = 0;

signals:
    void updateEnded();
    void updateFailed(const smp::Error& error);
};

// One decoded append, positioned in output frames
struct PcmSegment {
    int64_t start_frame = 0;
    std::shared_ptr<PcmChunk> pcm;
    size_t encoded_bytes = 0;

    int64_t end_frame() const { return start_frame + pcm->frames(); }
};

// Worker-thread decode result (QFuture payloads must be default-constructible)
struct DecodeOutcome {
    std::shared_ptr<PcmChunk> pcm;
    Error error = Error::ok();
};

// SourceBuffer in sequence mode: each append is decoded to PCM on the
// shared DecodePool and placed directly after the previous one.
class PcmSourceBuffer : public SourceBuffer {
    Q_OBJECT

public:
    PcmSourceBuffer(const AudioFormat& format, size_t quota_bytes, QObject* parent = nullptr);
    ~PcmSourceBuffer() override;

    bool Updating() const override;
    Result<void> AppendBuffer(const QByteArray& bytes, const QString& mime_type) override;
    Result<void> Remove(TimeUS start, TimeUS end) override;
    std::vector<TimeSpan> Buffered() const override;
    void Abort() override;
    void EndOfStream() override;
    bool Ended() const override;

    const AudioFormat& Format() const { return m_format; }

    // Encoded bytes still accounted against the quota
    size_t RetainedBytes() const { return m_retained_bytes; }

    // Frame just past the last appended sample (sequence end)
    int64_t EndFrame() const { return m_end_frame; }
    TimeUS EndTime() const;

    // Copy up to max_frames interleaved frames starting at frame_pos.
    // Stops at a gap; returns frames copied (0 when nothing is buffered there).
    int64_t CopyFrames(int64_t frame_pos, float* dst, int64_t max_frames) const;

signals:
    void endOfStreamSignalled();

private:
    void onDecodeFinished();
    void scheduleDeferredUpdate();
    void completeDeferredUpdate(uint64_t seq);

    AudioFormat m_format;
    size_t m_quota_bytes;
    size_t m_retained_bytes = 0;

    std::vector<PcmSegment> m_segments;
    int64_t m_end_frame = 0;

    bool m_updating = false;
    bool m_ended = false;
    uint64_t m_deferred_seq = 0;      // Remove or empty append awaiting completion
    bool m_deferred_pending = false;
    size_t m_pending_bytes = 0;

    // Watcher of the in-flight decode; Abort orphans it
    QFutureWatcher<DecodeOutcome>* m_watcher = nullptr;
};

} // namespace smp
