#include "chunk_buffer_appender.h"

#include "assert_handler.h"

Q_LOGGING_CATEGORY(lectorAppender, "lector.appender")

namespace lector {

ChunkBufferAppender::ChunkBufferAppender(std::shared_ptr<smp::SourceBuffer> buffer,
                                         CursorFn cursor,
                                         const AppenderConfig& config,
                                         QObject* parent)
    : QObject(parent)
    , m_buffer(std::move(buffer))
    , m_cursor(std::move(cursor))
    , m_config(config)
{
    LECTOR_ASSERT(m_buffer, "ChunkBufferAppender requires a source buffer");
    LECTOR_ASSERT(m_cursor, "ChunkBufferAppender requires a cursor function");

    connect(m_buffer.get(), &smp::SourceBuffer::updateEnded, this, &ChunkBufferAppender::onUpdateEnded);
    connect(m_buffer.get(), &smp::SourceBuffer::updateFailed, this, &ChunkBufferAppender::onUpdateFailed);
}

ChunkBufferAppender::~ChunkBufferAppender()
{
    dispose();
}

smp::Result<void> ChunkBufferAppender::append(const QString& mimeType, const QByteArray& bytes)
{
    if (m_disposed) {
        return smp::Error::invalid_state("append after dispose");
    }
    if (m_ended) {
        return smp::Error::invalid_state("append after end");
    }

    Operation op;
    op.kind = Operation::Kind::Append;
    op.mimeType = mimeType;
    op.bytes = bytes;
    m_queue.push_back(std::move(op));

    qCDebug(lectorAppender, "Queued append of %lld bytes (%d pending)",
            static_cast<long long>(bytes.size()), pendingOperations());
    dispatch();
    return smp::Result<void>();
}

void ChunkBufferAppender::end()
{
    if (m_ended || m_disposed) {
        return;
    }
    m_ended = true;

    Operation op;
    op.kind = Operation::Kind::Finalize;
    m_queue.push_back(std::move(op));
    dispatch();
}

smp::TimeUS ChunkBufferAppender::duration() const
{
    if (!m_buffer) {
        return 0;
    }
    auto ranges = m_buffer->Buffered();
    return ranges.empty() ? 0 : ranges.back().end;
}

void ChunkBufferAppender::dispose()
{
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    m_queue.clear();

    if (m_buffer) {
        disconnect(m_buffer.get(), nullptr, this, nullptr);
        if (m_busy) {
            m_buffer->Abort();
        }
    }
    m_busy = false;
    m_buffer.reset();
}

void ChunkBufferAppender::dispatch()
{
    // Algorithm: take front → insert window eviction ahead of appends → issue
    while (!m_busy && !m_disposed && !m_queue.empty()) {
        Operation& front = m_queue.front();

        if (front.kind == Operation::Kind::Append && !front.windowChecked) {
            front.windowChecked = true;
            auto ranges = m_buffer->Buffered();
            smp::TimeUS horizon = m_cursor() - m_config.slidingWindow;
            if (!ranges.empty() && ranges.front().start < horizon) {
                qCDebug(lectorAppender, "History beyond window, evicting before %lld",
                        static_cast<long long>(horizon));
                Operation evict;
                evict.kind = Operation::Kind::Evict;
                evict.evictEnd = horizon;
                m_queue.push_front(std::move(evict));
                continue;
            }
        }

        Operation op = std::move(m_queue.front());
        m_queue.pop_front();
        issue(op);
    }
}

void ChunkBufferAppender::issue(Operation& op)
{
    LECTOR_ASSERT(!m_busy, "ChunkBufferAppender: mutation already in flight");
    LECTOR_ASSERT(!m_buffer->Updating(), "ChunkBufferAppender: source buffer still updating");

    switch (op.kind) {
    case Operation::Kind::Evict:
        issueEvict(op.evictEnd);
        return;

    case Operation::Kind::Finalize:
        m_buffer->EndOfStream();
        m_finalized = true;
        qCDebug(lectorAppender, "Finalized at %lld", static_cast<long long>(duration()));
        emit finalized();
        return;

    case Operation::Kind::Append: {
        m_busy = true;
        m_inFlight = op;
        smp::Result<void> result = m_buffer->AppendBuffer(op.bytes, op.mimeType);
        if (result.is_ok()) {
            return;
        }
        m_busy = false;

        if (result.error().code == smp::ErrorCode::QuotaExceeded && !op.retried) {
            smp::TimeUS horizon = m_cursor() - m_config.aggressiveWindow;
            qCWarning(lectorAppender, "Quota exceeded, evicting before %lld and retrying",
                      static_cast<long long>(horizon));
            op.retried = true;
            m_queue.push_front(op);

            Operation evict;
            evict.kind = Operation::Kind::Evict;
            evict.evictEnd = horizon;
            m_queue.push_front(std::move(evict));
            return;
        }

        qCWarning(lectorAppender, "Append rejected: %s", result.error().describe().c_str());
        emit errorOccurred(result.error());
        return;
    }
    }
}

void ChunkBufferAppender::issueEvict(smp::TimeUS end)
{
    auto ranges = m_buffer->Buffered();
    if (ranges.empty() || end <= ranges.front().start) {
        qCDebug(lectorAppender, "Nothing to evict before %lld", static_cast<long long>(end));
        return;
    }

    m_busy = true;
    m_inFlight = Operation();
    m_inFlight.kind = Operation::Kind::Evict;
    m_inFlight.evictEnd = end;

    smp::Result<void> result = m_buffer->Remove(ranges.front().start, end);
    if (result.is_error()) {
        m_busy = false;
        qCWarning(lectorAppender, "Eviction failed: %s", result.error().describe().c_str());
    }
}

void ChunkBufferAppender::onUpdateEnded()
{
    if (!m_busy) {
        return;
    }
    m_busy = false;

    if (m_inFlight.kind == Operation::Kind::Append) {
        smp::TimeUS end = duration();
        qCDebug(lectorAppender, "Append complete, buffered to %lld", static_cast<long long>(end));
        emit appended(end);
    }
    m_inFlight = Operation();
    dispatch();
}

void ChunkBufferAppender::onUpdateFailed(const smp::Error& error)
{
    if (!m_busy) {
        return;
    }
    m_busy = false;

    qCWarning(lectorAppender, "Buffer update failed: %s", error.describe().c_str());
    if (m_inFlight.kind == Operation::Kind::Append) {
        emit errorOccurred(error);
    }
    m_inFlight = Operation();
    dispatch();
}

} // namespace lector
