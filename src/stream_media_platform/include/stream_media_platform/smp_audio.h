#pragma once

#include "smp_errors.h"
#include "smp_time.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace smp {

// Sample format (only F32)
enum class SampleFormat {
    F32  // 32-bit float, interleaved
};

// Audio format descriptor
struct AudioFormat {
    SampleFormat fmt;       // F32
    int32_t sample_rate;    // Device rate (typically 48000)
    int32_t channels;       // 2 (stereo) by default
};

inline AudioFormat default_audio_format() {
    return AudioFormat{SampleFormat::F32, 48000, 2};
}

// Forward declaration for implementation
class PcmChunkImpl;

// PCM audio chunk (decoded audio data)
// Immutable, refcounted via shared_ptr
class PcmChunk {
public:
    ~PcmChunk();

    int32_t sample_rate() const;
    int32_t channels() const;
    SampleFormat format() const;

    // Number of sample-frames (samples per channel)
    int64_t frames() const;

    // frames() expressed in microseconds
    TimeUS duration_us() const;

    // Interleaved float32 data, frames() * channels() floats
    const float* data_f32() const;

    // Internal: Constructor is public but PcmChunkImpl is opaque
    explicit PcmChunk(std::unique_ptr<PcmChunkImpl> impl);

    static std::shared_ptr<PcmChunk> FromSamples(int32_t sample_rate, int32_t channels,
                                                 std::vector<float> interleaved);

private:
    std::unique_ptr<PcmChunkImpl> m_impl;
};

// Decode a complete, self-contained encoded audio buffer (mp3, ogg, wav, ...)
// into interleaved float32 PCM at the requested output format.
// mime_type is a hint for the demuxer; an empty string lets FFmpeg probe.
Result<std::shared_ptr<PcmChunk>> DecodeAudioBuffer(const uint8_t* data, size_t size,
                                                    const std::string& mime_type,
                                                    const AudioFormat& out);

// Decode the buffer at its native rate and count samples.
// Container duration headers are ignored (unreliable for VBR mp3).
Result<TimeUS> MeasureAudioDuration(const uint8_t* data, size_t size,
                                    const std::string& mime_type);

} // namespace smp
