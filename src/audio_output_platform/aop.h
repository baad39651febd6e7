#pragma once

#include <memory>
#include <cstdint>
#include <string>

namespace aop {

// Configuration for audio output
struct AopConfig {
    int32_t sample_rate;       // Requested sample rate (default 48000)
    int32_t channels;          // Channel count (default 2, stereo)
    int32_t target_buffer_ms;  // Ring buffer size in ms (default 100)
};

// Report from device open
struct AopOpenReport {
    int32_t actual_sample_rate = 0;
    int32_t actual_channels = 0;
    int32_t actual_buffer_ms = 0;
    std::string device_name;
    std::string error;         // Set when Open() returns nullptr
};

// Forward declaration for implementation
class AudioOutputImpl;

// Audio output device wrapper
// Thread-safe for WriteF32 from any thread
class AudioOutput {
public:
    ~AudioOutput();

    // Open the default audio output device
    // Returns nullptr on failure (out_report->error says why)
    static std::unique_ptr<AudioOutput> Open(const AopConfig& config, AopOpenReport* out_report);

    // Close the audio output (called automatically by destructor)
    void Close();

    // Write PCM into ring buffer
    // Returns number of frames actually written (may be less than requested if buffer full)
    int64_t WriteF32(const float* interleaved, int64_t frames);

    // Free space in the ring buffer, in frames
    int64_t WritableFrames() const;

    // Microseconds of real (non-silence) audio consumed by the device
    // since the last Flush(). Does not advance while starved.
    int64_t PlayheadTimeUS() const;

    // Start/stop playback
    void Start();
    void Stop();

    // Drop buffered audio and reset the playhead (for seeking and pausing)
    void Flush();

    // Linear gain in [0, 1], applied as samples are pulled
    void SetVolume(float volume);

    // Internal constructor (public but impl is opaque)
    explicit AudioOutput(std::unique_ptr<AudioOutputImpl> impl);

private:
    std::unique_ptr<AudioOutputImpl> m_impl;
};

} // namespace aop
