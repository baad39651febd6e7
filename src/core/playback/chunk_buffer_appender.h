#pragma once

#include <stream_media_platform/smp_source_buffer.h>

#include <QByteArray>
#include <QLoggingCategory>
#include <QObject>
#include <QString>

#include <deque>
#include <functional>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(lectorAppender)

namespace lector {

struct AppenderConfig {
    smp::TimeUS slidingWindow = 30 * smp::kMicrosPerSecond;
    smp::TimeUS aggressiveWindow = 15 * smp::kMicrosPerSecond;
};

/**
 * ChunkBufferAppender: serializes mutations against one SourceBuffer.
 *
 * Appends, evictions and the final end-of-stream go through a FIFO of
 * pending operations; at most one mutation is in flight and the next is
 * issued when the buffer reports completion.
 *
 * Retention: before each append, history behind the playback cursor
 * beyond the sliding window is evicted first. A QuotaExceeded rejection
 * triggers an aggressive eviction and one retry of the same append.
 */
class ChunkBufferAppender : public QObject
{
    Q_OBJECT

public:
    using CursorFn = std::function<smp::TimeUS()>;

    ChunkBufferAppender(std::shared_ptr<smp::SourceBuffer> buffer,
                        CursorFn cursor,
                        const AppenderConfig& config = AppenderConfig(),
                        QObject* parent = nullptr);
    ~ChunkBufferAppender() override;

    // Queue bytes for appending. InvalidState after end() or dispose().
    smp::Result<void> append(const QString& mimeType, const QByteArray& bytes);

    // Finalize once queued work drains. Idempotent.
    void end();

    // End of the buffered media
    smp::TimeUS duration() const;

    // Cancel queued and in-flight work and release the buffer
    void dispose();

    bool isBusy() const { return m_busy; }
    int pendingOperations() const { return static_cast<int>(m_queue.size()); }
    bool isEnded() const { return m_ended; }
    bool isFinalized() const { return m_finalized; }

signals:
    void appended(qint64 bufferedEnd);
    void errorOccurred(const smp::Error& error);
    void finalized();

private:
    struct Operation {
        enum class Kind { Evict, Append, Finalize };
        Kind kind = Kind::Append;
        QString mimeType;
        QByteArray bytes;
        smp::TimeUS evictEnd = 0;
        bool windowChecked = false;
        bool retried = false;
    };

    void dispatch();
    void issue(Operation& op);
    void issueEvict(smp::TimeUS end);
    void onUpdateEnded();
    void onUpdateFailed(const smp::Error& error);

    std::shared_ptr<smp::SourceBuffer> m_buffer;
    CursorFn m_cursor;
    AppenderConfig m_config;

    std::deque<Operation> m_queue;
    Operation m_inFlight;
    bool m_busy = false;
    bool m_ended = false;
    bool m_finalized = false;
    bool m_disposed = false;
};

} // namespace lector
