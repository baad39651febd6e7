#pragma once

#include <stream_media_platform/smp_audio.h>
#include <vector>

namespace smp {

// Internal implementation of PcmChunk
class PcmChunkImpl {
public:
    PcmChunkImpl(int32_t sample_rate, int32_t channels, SampleFormat format,
                 std::vector<float> data);

    int32_t sample_rate;
    int32_t channels;
    SampleFormat format;
    std::vector<float> data;  // Interleaved float32
};

} // namespace smp
