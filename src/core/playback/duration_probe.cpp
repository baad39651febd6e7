#include "duration_probe.h"

#include "timeline_compositor.h"

#include <stream_media_platform/smp_audio.h>
#include <stream_media_platform/smp_decode_pool.h>

#include <QFutureWatcher>

namespace lector {

namespace {

struct ProbeOutcome {
    smp::TimeUS duration = 0;
    smp::Error error = smp::Error::ok();
};

} // namespace

DecodingDurationProbe::DecodingDurationProbe(QObject* parent)
    : QObject(parent)
{
}

DecodingDurationProbe::~DecodingDurationProbe() = default;

void DecodingDurationProbe::measure(const QString& mimeType, const QByteArray& bytes, Callback done)
{
    const std::string mime = mimeType.toStdString();
    QFuture<ProbeOutcome> future = smp::DecodePool::Shared().Run<ProbeOutcome>([bytes, mime]() {
        ProbeOutcome outcome;
        auto result = smp::MeasureAudioDuration(reinterpret_cast<const uint8_t*>(bytes.constData()),
                                                static_cast<size_t>(bytes.size()), mime);
        if (result.is_error()) {
            outcome.error = result.error();
        } else {
            outcome.duration = result.value();
        }
        return outcome;
    });

    // Watcher is a child: destroying the probe drops the callback
    auto* watcher = new QFutureWatcher<ProbeOutcome>(this);
    connect(watcher, &QFutureWatcherBase::finished, this, [watcher, done, mimeType]() {
        watcher->deleteLater();
        if (watcher->isCanceled() || watcher->future().resultCount() == 0) {
            return;
        }
        ProbeOutcome outcome = watcher->result();
        if (outcome.error.code != smp::ErrorCode::Ok) {
            qCWarning(lectorCompositor, "Duration probe failed for %s chunk: %s",
                      qPrintable(mimeType), outcome.error.describe().c_str());
        }
        done(outcome.duration);
    });
    watcher->setFuture(future);
}

} // namespace lector
