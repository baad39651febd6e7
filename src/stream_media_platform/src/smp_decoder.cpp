#include <stream_media_platform/smp_audio.h>
#include "impl/ffmpeg_context.h"
#include "impl/ffmpeg_resample.h"
#include "impl/pcm_chunk_impl.h"
#include "smp_log.h"

namespace smp {

namespace {

// Packet + frame pair released on scope exit
struct DecodeScratch {
    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();

    ~DecodeScratch() {
        av_frame_free(&frame);
        av_packet_free(&pkt);
    }
    bool valid() const { return pkt != nullptr && frame != nullptr; }
};

struct OpenedAudio {
    impl::FFmpegFormatContext fmt;
    impl::FFmpegCodecContext codec;
};

Result<void> open_audio(OpenedAudio& audio, const uint8_t* data, size_t size,
                        const std::string& mime_type) {
    auto open_result = audio.fmt.open_memory(data, size, mime_type);
    if (open_result.is_error()) {
        return open_result.error();
    }

    auto stream_result = audio.fmt.find_audio_stream();
    if (stream_result.is_error()) {
        return stream_result.error();
    }

    return audio.codec.init(audio.fmt.audio_codec_params());
}

} // namespace

Result<std::shared_ptr<PcmChunk>> DecodeAudioBuffer(const uint8_t* data, size_t size,
                                                    const std::string& mime_type,
                                                    const AudioFormat& out) {
    OpenedAudio audio;
    auto open_result = open_audio(audio, data, size, mime_type);
    if (open_result.is_error()) {
        SMP_LOG_WARN("decode open failed: %s", open_result.error().describe().c_str());
        return open_result.error();
    }

    AVCodecContext* codec_ctx = audio.codec.get();
    impl::FFmpegResampleContext resampler;
    auto init_result = resampler.init(codec_ctx->sample_rate, &codec_ctx->ch_layout,
                                      codec_ctx->sample_fmt, out);
    if (init_result.is_error()) {
        return init_result.error();
    }

    DecodeScratch scratch;
    if (!scratch.valid()) {
        return Error::internal("av_packet_alloc/av_frame_alloc failed");
    }

    std::vector<float> samples;
    int64_t decoded_frames = 0;
    while (true) {
        auto frame_result = impl::decode_next_frame(codec_ctx, audio.fmt.get(),
                                                    audio.fmt.audio_stream_index(),
                                                    scratch.pkt, scratch.frame);
        if (frame_result.is_error()) {
            return frame_result.error();
        }
        AVFrame* frame = frame_result.value();
        if (!frame) {
            break;
        }

        decoded_frames += frame->nb_samples;
        auto convert_result = resampler.convert_append(
            const_cast<const uint8_t* const*>(frame->extended_data),
            frame->nb_samples, samples);
        av_frame_unref(frame);
        if (convert_result.is_error()) {
            return convert_result.error();
        }
    }

    auto flush_result = resampler.flush_append(samples);
    if (flush_result.is_error()) {
        return flush_result.error();
    }

    if (decoded_frames == 0) {
        return Error::decode_failed("No audio frames decoded");
    }

    SMP_LOG_DEBUG("decoded %lld source frames -> %zu output samples",
                  static_cast<long long>(decoded_frames), samples.size());

    return std::make_shared<PcmChunk>(std::make_unique<PcmChunkImpl>(
        out.sample_rate, out.channels, SampleFormat::F32, std::move(samples)));
}

Result<TimeUS> MeasureAudioDuration(const uint8_t* data, size_t size,
                                    const std::string& mime_type) {
    OpenedAudio audio;
    auto open_result = open_audio(audio, data, size, mime_type);
    if (open_result.is_error()) {
        return open_result.error();
    }

    AVCodecContext* codec_ctx = audio.codec.get();
    if (codec_ctx->sample_rate <= 0) {
        return Error::decode_failed("Stream reports no sample rate");
    }

    DecodeScratch scratch;
    if (!scratch.valid()) {
        return Error::internal("av_packet_alloc/av_frame_alloc failed");
    }

    int64_t total_samples = 0;
    while (true) {
        auto frame_result = impl::decode_next_frame(codec_ctx, audio.fmt.get(),
                                                    audio.fmt.audio_stream_index(),
                                                    scratch.pkt, scratch.frame);
        if (frame_result.is_error()) {
            return frame_result.error();
        }
        AVFrame* frame = frame_result.value();
        if (!frame) {
            break;
        }
        total_samples += frame->nb_samples;
        av_frame_unref(frame);
    }

    return frames_to_us(total_samples, codec_ctx->sample_rate);
}

} // namespace smp
