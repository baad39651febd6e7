#pragma once

#include <QMetaType>

namespace lector {

// Requested playback intent
enum class PlaybackState {
    Play,
    Pause,
    Ended
};

// Whether playback is waiting for data at the cursor
enum class BufferingState {
    Buffering,
    Ready
};

inline const char* playbackStateName(PlaybackState state)
{
    switch (state) {
        case PlaybackState::Play:  return "Play";
        case PlaybackState::Pause: return "Pause";
        case PlaybackState::Ended: return "Ended";
    }
    return "Unknown";
}

inline const char* bufferingStateName(BufferingState state)
{
    return state == BufferingState::Buffering ? "Buffering" : "Ready";
}

} // namespace lector

Q_DECLARE_METATYPE(lector::PlaybackState)
Q_DECLARE_METATYPE(lector::BufferingState)
