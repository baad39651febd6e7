#include <stream_media_platform/smp_audio.h>
#include "impl/pcm_chunk_impl.h"
#include <cassert>

namespace smp {

PcmChunkImpl::PcmChunkImpl(int32_t sample_rate_, int32_t channels_, SampleFormat format_,
                           std::vector<float> data_)
    : sample_rate(sample_rate_)
    , channels(channels_)
    , format(format_)
    , data(std::move(data_)) {
}

PcmChunk::PcmChunk(std::unique_ptr<PcmChunkImpl> impl)
    : m_impl(std::move(impl)) {
    assert(m_impl && "PcmChunk impl cannot be null");
}

PcmChunk::~PcmChunk() = default;

std::shared_ptr<PcmChunk> PcmChunk::FromSamples(int32_t sample_rate, int32_t channels,
                                                std::vector<float> interleaved) {
    return std::make_shared<PcmChunk>(std::make_unique<PcmChunkImpl>(
        sample_rate, channels, SampleFormat::F32, std::move(interleaved)));
}

int32_t PcmChunk::sample_rate() const {
    return m_impl->sample_rate;
}

int32_t PcmChunk::channels() const {
    return m_impl->channels;
}

SampleFormat PcmChunk::format() const {
    return m_impl->format;
}

int64_t PcmChunk::frames() const {
    if (m_impl->channels == 0) return 0;
    return static_cast<int64_t>(m_impl->data.size()) / m_impl->channels;
}

TimeUS PcmChunk::duration_us() const {
    if (m_impl->sample_rate <= 0) return 0;
    return frames_to_us(frames(), m_impl->sample_rate);
}

const float* PcmChunk::data_f32() const {
    return m_impl->data.data();
}

} // namespace smp
