#include "ffmpeg_context.h"
#include <algorithm>
#include <cassert>
#include <cstring>
#include <mutex>

namespace smp {
namespace impl {

namespace {

constexpr int kAvioBufferSize = 4096;

int memory_read(void* opaque, uint8_t* buf, int buf_size) {
    auto* input = static_cast<MemoryInput*>(opaque);
    size_t remaining = input->size - input->pos;
    if (remaining == 0) {
        return AVERROR_EOF;
    }
    size_t to_copy = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, input->data + input->pos, to_copy);
    input->pos += to_copy;
    return static_cast<int>(to_copy);
}

int64_t memory_seek(void* opaque, int64_t offset, int whence) {
    auto* input = static_cast<MemoryInput*>(opaque);
    if (whence & AVSEEK_SIZE) {
        return static_cast<int64_t>(input->size);
    }

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(input->pos); break;
        case SEEK_END: base = static_cast<int64_t>(input->size); break;
        default: return AVERROR(EINVAL);
    }

    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(input->size)) {
        return AVERROR(EINVAL);
    }
    input->pos = static_cast<size_t>(target);
    return target;
}

} // namespace

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL)) {
        return Error::decode_failed(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND || errnum == AVERROR_DEMUXER_NOT_FOUND) {
        return Error::unsupported(msg);
    }
    return Error::internal(msg);
}

void init_ffmpeg_logging() {
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });
}

const char* demuxer_for_mime(const std::string& mime_type) {
    // Strip parameters ("audio/ogg; codecs=opus")
    std::string base = mime_type.substr(0, mime_type.find(';'));
    if (base == "audio/mpeg" || base == "audio/mp3") return "mp3";
    if (base == "audio/ogg" || base == "audio/opus") return "ogg";
    if (base == "audio/wav" || base == "audio/x-wav" || base == "audio/wave") return "wav";
    if (base == "audio/aac") return "aac";
    if (base == "audio/flac") return "flac";
    return nullptr;
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    release();
}

void FFmpegFormatContext::release() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
    // Custom IO is not owned by the format context
    if (m_avio_ctx) {
        av_freep(&m_avio_ctx->buffer);
        avio_context_free(&m_avio_ctx);
    }
    m_audio_stream_idx = -1;
}

Result<void> FFmpegFormatContext::open_memory(const uint8_t* data, size_t size,
                                              const std::string& mime_type) {
    assert(!m_fmt_ctx && "Format context already opened");
    init_ffmpeg_logging();

    if (data == nullptr || size == 0) {
        return Error::invalid_arg("Empty audio buffer");
    }

    m_input = MemoryInput{data, size, 0};

    auto* avio_buffer = static_cast<unsigned char*>(av_malloc(kAvioBufferSize));
    if (!avio_buffer) {
        return Error::internal("av_malloc failed for AVIO buffer");
    }

    m_avio_ctx = avio_alloc_context(avio_buffer, kAvioBufferSize, 0, &m_input,
                                    &memory_read, nullptr, &memory_seek);
    if (!m_avio_ctx) {
        av_free(avio_buffer);
        return Error::internal("avio_alloc_context failed");
    }

    m_fmt_ctx = avformat_alloc_context();
    if (!m_fmt_ctx) {
        release();
        return Error::internal("avformat_alloc_context failed");
    }
    m_fmt_ctx->pb = m_avio_ctx;
    m_fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    const AVInputFormat* input_format = nullptr;
    if (const char* demuxer = demuxer_for_mime(mime_type)) {
        input_format = av_find_input_format(demuxer);
    }

    // avformat_open_input frees m_fmt_ctx on failure
    int ret = avformat_open_input(&m_fmt_ctx, nullptr, input_format, nullptr);
    if (ret < 0) {
        m_fmt_ctx = nullptr;
        release();
        return ffmpeg_error(ret, "avformat_open_input(" + mime_type + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        release();
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void>();
}

Result<int> FFmpegFormatContext::find_audio_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    m_audio_stream_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO,
                                             -1, -1, nullptr, 0);
    if (m_audio_stream_idx < 0) {
        return Error::unsupported("No audio stream found");
    }
    return m_audio_stream_idx;
}

AVStream* FFmpegFormatContext::audio_stream() const {
    if (!m_fmt_ctx || m_audio_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_audio_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::audio_codec_params() const {
    AVStream* stream = audio_stream();
    return stream ? stream->codecpar : nullptr;
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        if (m_codec_ctx) {
            avcodec_free_context(&m_codec_ctx);
        }
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init(AVCodecParameters* params) {
    assert(params && "Codec parameters required");

    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported(std::string("No decoder for codec ") +
                                  avcodec_get_name(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("avcodec_alloc_context3 failed");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_open2");
    }

    return Result<void>();
}

} // namespace impl
} // namespace smp
