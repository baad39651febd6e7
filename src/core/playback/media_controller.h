#pragma once

#include "playback_types.h"

#include <stream_media_platform/smp_media_handle.h>

#include <QLoggingCategory>
#include <QMetaObject>
#include <QObject>
#include <QList>

Q_DECLARE_LOGGING_CATEGORY(lectorPlayback)

namespace lector {

/**
 * MediaController: keeps a MediaHandle aligned with the requested state.
 *
 * The handle may pause, resume or stall on its own. Every native
 * notification is compared against the preferred state and corrected:
 * - native playing while the preference is Pause/Ended: pause again
 * - native paused while the preference is Play: play again
 * - natural end: preference becomes Ended (the only unprompted change)
 *
 * A policy refusal of play() (smp::ErrorCode::NotAllowed) reverts the
 * preference to Pause. Other play() failures are logged only.
 *
 * The handle is not owned and must outlive the controller.
 */
class MediaController : public QObject
{
    Q_OBJECT

public:
    explicit MediaController(smp::MediaHandle* handle, QObject* parent = nullptr);
    ~MediaController() override;

    void play();
    void pause();
    void setState(PlaybackState state);
    PlaybackState state() const { return m_state; }

    smp::TimeUS currentTime() const;
    void setCurrentTime(smp::TimeUS time);
    smp::TimeUS duration() const;

    bool isBuffering() const { return m_buffering; }

    double volume() const;
    void setVolume(double volume);

    smp::MediaHandle* handle() const { return m_handle; }

signals:
    void stateChanged(lector::PlaybackState state);
    void bufferingStateChanged(bool buffering);
    void timeUpdated(qint64 time);
    void durationChanged(qint64 duration);

private:
    void onNativePlaying();
    void onNativePaused();
    void onNativeEnded();
    void onNativeReady();
    void onNativeStall();

    void reconcile();
    void attemptPlay();
    void storeState(PlaybackState state);
    bool updateBuffering();

    smp::MediaHandle* m_handle;
    PlaybackState m_state = PlaybackState::Pause;
    bool m_buffering = false;
    QList<QMetaObject::Connection> m_connections;
};

} // namespace lector
