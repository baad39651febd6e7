#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/opt.h>
}

#include <stream_media_platform/smp_errors.h>
#include <stream_media_platform/smp_audio.h>
#include <vector>

namespace smp {
namespace impl {

// SwrContext wrapper for audio resampling
// Converts any input format to interleaved float32 at the target rate/channels
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    FFmpegResampleContext(FFmpegResampleContext&& other) noexcept;
    FFmpegResampleContext& operator=(FFmpegResampleContext&& other) noexcept;

    Result<void> init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                      AVSampleFormat src_sample_fmt, const AudioFormat& out);

    // Resample one decoded frame, appending interleaved samples to dst.
    // Returns number of output frames appended.
    Result<int64_t> convert_append(const uint8_t* const* src_data, int src_samples,
                                   std::vector<float>& dst);

    // Drain samples buffered inside the resampler
    Result<int64_t> flush_append(std::vector<float>& dst);

private:
    SwrContext* m_swr_ctx = nullptr;
    int m_dst_channels = 2;
};

} // namespace impl
} // namespace smp
