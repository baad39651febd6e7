#include "media_controller.h"

#include "assert_handler.h"

Q_LOGGING_CATEGORY(lectorPlayback, "lector.playback")

namespace lector {

MediaController::MediaController(smp::MediaHandle* handle, QObject* parent)
    : QObject(parent)
    , m_handle(handle)
{
    LECTOR_ASSERT(m_handle, "MediaController requires a media handle");

    m_buffering = m_handle->GetReadyState() < smp::ReadyState::HaveFutureData;

    m_connections << connect(m_handle, &smp::MediaHandle::playing, this, &MediaController::onNativePlaying);
    m_connections << connect(m_handle, &smp::MediaHandle::paused, this, &MediaController::onNativePaused);
    m_connections << connect(m_handle, &smp::MediaHandle::ended, this, &MediaController::onNativeEnded);
    m_connections << connect(m_handle, &smp::MediaHandle::canPlay, this, &MediaController::onNativeReady);
    m_connections << connect(m_handle, &smp::MediaHandle::seeked, this, &MediaController::onNativeReady);
    m_connections << connect(m_handle, &smp::MediaHandle::stalled, this, &MediaController::onNativeStall);
    m_connections << connect(m_handle, &smp::MediaHandle::suspended, this, &MediaController::onNativeStall);
    m_connections << connect(m_handle, &smp::MediaHandle::waiting, this, &MediaController::onNativeStall);
    m_connections << connect(m_handle, &smp::MediaHandle::timeUpdated, this, [this]() {
        emit timeUpdated(m_handle->CurrentTime());
    });
    m_connections << connect(m_handle, &smp::MediaHandle::durationChanged, this, [this]() {
        emit durationChanged(m_handle->Duration());
    });
    m_connections << connect(m_handle, &smp::MediaHandle::errorOccurred, this, [](const QString& message) {
        qCWarning(lectorPlayback, "Media error: %s", qPrintable(message));
    });
}

MediaController::~MediaController()
{
    for (const auto& connection : m_connections) {
        disconnect(connection);
    }
}

void MediaController::play()
{
    qCDebug(lectorPlayback, "play()");
    storeState(PlaybackState::Play);
    attemptPlay();
}

void MediaController::pause()
{
    qCDebug(lectorPlayback, "pause()");
    storeState(PlaybackState::Pause);
    m_handle->Pause();
}

void MediaController::setState(PlaybackState state)
{
    if (state == m_state) {
        return;
    }
    storeState(state);
    reconcile();
}

smp::TimeUS MediaController::currentTime() const
{
    return m_handle->CurrentTime();
}

void MediaController::setCurrentTime(smp::TimeUS time)
{
    m_handle->SetCurrentTime(time);
}

smp::TimeUS MediaController::duration() const
{
    return m_handle->Duration();
}

double MediaController::volume() const
{
    return m_handle->Volume();
}

void MediaController::setVolume(double volume)
{
    m_handle->SetVolume(volume);
}

void MediaController::onNativePlaying()
{
    if (m_state != PlaybackState::Play) {
        qCDebug(lectorPlayback, "Native playing while preferred %s, pausing",
                playbackStateName(m_state));
        m_handle->Pause();
    }
}

void MediaController::onNativePaused()
{
    if (m_state == PlaybackState::Play) {
        qCDebug(lectorPlayback, "Native paused while preferred Play, resuming");
        attemptPlay();
    }
}

void MediaController::onNativeEnded()
{
    qCDebug(lectorPlayback, "Native ended");
    storeState(PlaybackState::Ended);
}

void MediaController::onNativeReady()
{
    updateBuffering();
    reconcile();
}

void MediaController::onNativeStall()
{
    updateBuffering();
    if (m_buffering) {
        reconcile();
    }
}

void MediaController::reconcile()
{
    // Algorithm: Play → ensure playing; Pause/Ended → ensure paused
    if (m_state == PlaybackState::Play) {
        if (m_handle->Paused()) {
            attemptPlay();
        }
    } else if (!m_handle->Paused()) {
        m_handle->Pause();
    }
}

void MediaController::attemptPlay()
{
    smp::Result<void> result = m_handle->Play();
    if (result.is_ok()) {
        return;
    }

    if (result.error().code == smp::ErrorCode::NotAllowed) {
        qCInfo(lectorPlayback, "Playback refused by policy, reverting to Pause");
        storeState(PlaybackState::Pause);
        return;
    }
    qCWarning(lectorPlayback, "play() failed: %s", result.error().describe().c_str());
}

void MediaController::storeState(PlaybackState state)
{
    if (state == m_state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

bool MediaController::updateBuffering()
{
    bool buffering = m_handle->GetReadyState() < smp::ReadyState::HaveFutureData;
    if (buffering == m_buffering) {
        return false;
    }
    m_buffering = buffering;
    qCDebug(lectorPlayback, "Buffering: %s", buffering ? "yes" : "no");
    emit bufferingStateChanged(buffering);
    return true;
}

} // namespace lector
