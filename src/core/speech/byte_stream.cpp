#include "byte_stream.h"

#include "assert_handler.h"

namespace lector {

ByteStreamDrain::ByteStreamDrain(ByteStream* stream, QObject* parent)
    : QObject(parent)
    , m_stream(stream)
{
    LECTOR_ASSERT(m_stream, "ByteStreamDrain requires a stream");

    connect(m_stream, &ByteStream::dataReceived, this, [this](const QByteArray& data) {
        if (m_done) {
            return;
        }
        m_data.append(data);
        ++m_reads;
    });
    connect(m_stream, &ByteStream::finished, this, [this]() {
        if (m_done) {
            return;
        }
        m_done = true;
        emit drained(m_data);
    });
    connect(m_stream, &ByteStream::failed, this, [this](const smp::Error& error) {
        if (m_done) {
            return;
        }
        m_done = true;
        emit failed(error);
    });
}

void ByteStreamDrain::start()
{
    m_stream->start();
}

void ByteStreamDrain::abort()
{
    if (m_done) {
        return;
    }
    m_done = true;
    m_stream->abort();
}

} // namespace lector
