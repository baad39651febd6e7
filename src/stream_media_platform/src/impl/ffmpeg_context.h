#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <stream_media_platform/smp_errors.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace smp {
namespace impl {

// Convert FFmpeg error code to SMP Error
Error ffmpeg_error(int errnum, const std::string& context);

// Silence FFmpeg's own logger once per process (mp3 decoders are chatty
// about junk before the first frame header)
void init_ffmpeg_logging();

// Read cursor over a caller-owned byte buffer, used as AVIOContext opaque
struct MemoryInput {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

// FFmpeg format context wrapper reading from memory
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable, non-movable (AVIOContext holds a pointer to m_input)
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Open an in-memory container. data must outlive this context.
    // mime_type selects the demuxer when recognised, otherwise FFmpeg probes.
    Result<void> open_memory(const uint8_t* data, size_t size, const std::string& mime_type);

    // Find best audio stream
    Result<int> find_audio_stream();

    AVFormatContext* get() const { return m_fmt_ctx; }
    int audio_stream_index() const { return m_audio_stream_idx; }
    AVStream* audio_stream() const;
    AVCodecParameters* audio_codec_params() const;

private:
    void release();

    MemoryInput m_input;
    AVIOContext* m_avio_ctx = nullptr;
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_audio_stream_idx = -1;
};

// FFmpeg codec context wrapper (software decode only)
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    Result<void> init(AVCodecParameters* params);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
};

// Map a MIME type to an FFmpeg demuxer short name (nullptr = probe)
const char* demuxer_for_mime(const std::string& mime_type);

// Decode next frame of stream_idx.
// Returns:
//   - frame on success
//   - nullptr when the stream is drained
//   - error on demux/decode failure
Result<AVFrame*> decode_next_frame(AVCodecContext* codec_ctx, AVFormatContext* fmt_ctx,
                                   int stream_idx, AVPacket* pkt, AVFrame* frame);

} // namespace impl
} // namespace smp
