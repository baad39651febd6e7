#include "ffmpeg_resample.h"
#include "ffmpeg_context.h"
#include <cassert>

namespace smp {
namespace impl {

FFmpegResampleContext::~FFmpegResampleContext() {
    if (m_swr_ctx) {
        swr_free(&m_swr_ctx);
    }
}

FFmpegResampleContext::FFmpegResampleContext(FFmpegResampleContext&& other) noexcept
    : m_swr_ctx(other.m_swr_ctx),
      m_dst_channels(other.m_dst_channels) {
    other.m_swr_ctx = nullptr;
}

FFmpegResampleContext& FFmpegResampleContext::operator=(FFmpegResampleContext&& other) noexcept {
    if (this != &other) {
        if (m_swr_ctx) {
            swr_free(&m_swr_ctx);
        }
        m_swr_ctx = other.m_swr_ctx;
        m_dst_channels = other.m_dst_channels;
        other.m_swr_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegResampleContext::init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                                          AVSampleFormat src_sample_fmt, const AudioFormat& out) {
    if (out.channels <= 0 || out.sample_rate <= 0) {
        return Error::invalid_arg("Output format needs positive rate and channel count");
    }
    m_dst_channels = out.channels;

    AVChannelLayout dst_layout;
    av_channel_layout_default(&dst_layout, out.channels);

    int ret = swr_alloc_set_opts2(&m_swr_ctx,
        &dst_layout,
        AV_SAMPLE_FMT_FLT,        // interleaved float32
        out.sample_rate,
        src_ch_layout,
        src_sample_fmt,
        src_sample_rate,
        0, nullptr);
    av_channel_layout_uninit(&dst_layout);

    if (ret < 0) {
        return ffmpeg_error(ret, "swr_alloc_set_opts2");
    }

    ret = swr_init(m_swr_ctx);
    if (ret < 0) {
        swr_free(&m_swr_ctx);
        return ffmpeg_error(ret, "swr_init");
    }

    return Result<void>();
}

Result<int64_t> FFmpegResampleContext::convert_append(const uint8_t* const* src_data, int src_samples,
                                                      std::vector<float>& dst) {
    assert(m_swr_ctx && "Resample context not initialized");

    int max_out = swr_get_out_samples(m_swr_ctx, src_samples);
    if (max_out <= 0) {
        return int64_t{0};
    }

    size_t old_size = dst.size();
    dst.resize(old_size + static_cast<size_t>(max_out) * static_cast<size_t>(m_dst_channels));
    uint8_t* dst_planes[1] = { reinterpret_cast<uint8_t*>(dst.data() + old_size) };

    int ret = swr_convert(m_swr_ctx, dst_planes, max_out, src_data, src_samples);
    if (ret < 0) {
        dst.resize(old_size);
        return ffmpeg_error(ret, "swr_convert");
    }

    dst.resize(old_size + static_cast<size_t>(ret) * static_cast<size_t>(m_dst_channels));
    return static_cast<int64_t>(ret);
}

Result<int64_t> FFmpegResampleContext::flush_append(std::vector<float>& dst) {
    return convert_append(nullptr, 0, dst);
}

} // namespace impl
} // namespace smp
