#pragma once

#include <stream_media_platform/smp_errors.h>

#include <QByteArray>
#include <QObject>

namespace lector {

/**
 * Asynchronous byte stream: a response body delivered in partial reads.
 * After start(), emits dataReceived zero or more times and then exactly
 * one of finished or failed. abort() suppresses every later signal.
 */
class ByteStream : public QObject
{
    Q_OBJECT

public:
    explicit ByteStream(QObject* parent = nullptr) : QObject(parent) {}
    ~ByteStream() override = default;

    virtual void start() = 0;
    virtual void abort() = 0;

signals:
    void dataReceived(const QByteArray& data);
    void finished();
    void failed(const smp::Error& error);
};

/**
 * Drains a ByteStream into one buffer.
 */
class ByteStreamDrain : public QObject
{
    Q_OBJECT

public:
    explicit ByteStreamDrain(ByteStream* stream, QObject* parent = nullptr);

    void start();
    void abort();

    const QByteArray& data() const { return m_data; }
    int reads() const { return m_reads; }

signals:
    void drained(const QByteArray& data);
    void failed(const smp::Error& error);

private:
    ByteStream* m_stream;
    QByteArray m_data;
    int m_reads = 0;
    bool m_done = false;
};

} // namespace lector
