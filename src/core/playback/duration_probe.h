#pragma once

#include <stream_media_platform/smp_time.h>

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>

namespace lector {

// Measures a chunk's playable duration. done() runs on the caller's thread,
// possibly after later measurements have completed.
class DurationProbe
{
public:
    using Callback = std::function<void(smp::TimeUS)>;

    virtual ~DurationProbe() = default;
    virtual void measure(const QString& mimeType, const QByteArray& bytes, Callback done) = 0;
};

/**
 * Decodes the whole chunk on the decode pool and counts samples.
 * A decode failure reports 0 and logs a warning.
 * Pending callbacks are dropped when the probe is destroyed.
 */
class DecodingDurationProbe : public QObject, public DurationProbe
{
    Q_OBJECT

public:
    explicit DecodingDurationProbe(QObject* parent = nullptr);
    ~DecodingDurationProbe() override;

    void measure(const QString& mimeType, const QByteArray& bytes, Callback done) override;
};

} // namespace lector
