#pragma once

#include "smp_errors.h"
#include "smp_time.h"

#include <QObject>

namespace smp {

// Readiness of the data at the current playback position
enum class ReadyState {
    HaveNothing = 0,     // no data at all
    HaveMetadata = 1,    // duration known, nothing at the position
    HaveCurrentData = 2, // data for the position, nothing beyond it
    HaveFutureData = 3,  // data ahead of the position
    HaveEnoughData = 4   // data through the end (or a comfortable margin)
};

// Low-level playable media primitive.
// Notifications mirror the HTML media element: they report what the
// primitive did, which may differ from what its owner asked for.
class MediaHandle : public QObject {
    Q_OBJECT

public:
    explicit MediaHandle(QObject* parent = nullptr) : QObject(parent) {}
    ~MediaHandle() override = default;

    // NotAllowed when the autoplay policy refuses playback
    virtual Result<void> Play() = 0;
    virtual void Pause() = 0;
    virtual bool Paused() const = 0;

    virtual TimeUS CurrentTime() const = 0;
    virtual void SetCurrentTime(TimeUS t) = 0;
    virtual TimeUS Duration() const = 0;

    virtual ReadyState GetReadyState() const = 0;

    virtual double Volume() const = 0;
    virtual void SetVolume(double volume) = 0;

signals:
    void playing();
    void paused();
    void ended();
    void canPlay();
    void seeked();
    void stalled();
    void suspended();
    void waiting();
    void timeUpdated();
    void durationChanged();
    void errorOccurred(const QString& message);
};

// Process-wide playback policy. When disallowed, Play() is refused with
// ErrorCode::NotAllowed until the embedder allows it again.
void SetAutoplayAllowed(bool allowed);
bool AutoplayAllowed();

} // namespace smp
