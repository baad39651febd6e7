#include "ffmpeg_context.h"
#include <stream_media_platform/smp_errors.h>

namespace smp {
namespace impl {

Result<AVFrame*> decode_next_frame(AVCodecContext* codec_ctx, AVFormatContext* fmt_ctx,
                                   int stream_idx, AVPacket* pkt, AVFrame* frame) {
    int ret;
    bool flushing = false;

    while (true) {
        // Try to receive a frame from the decoder
        ret = avcodec_receive_frame(codec_ctx, frame);
        if (ret == 0) {
            return frame;
        } else if (ret == AVERROR_EOF) {
            return static_cast<AVFrame*>(nullptr);
        } else if (ret != AVERROR(EAGAIN)) {
            return ffmpeg_error(ret, "avcodec_receive_frame");
        }

        if (flushing) {
            // Decoder wants input after a flush packet: nothing left
            return static_cast<AVFrame*>(nullptr);
        }

        // Read next packet of our stream
        while (true) {
            ret = av_read_frame(fmt_ctx, pkt);
            if (ret < 0) {
                if (ret == AVERROR_EOF) {
                    // Enter draining mode; remaining frames come out above
                    avcodec_send_packet(codec_ctx, nullptr);
                    flushing = true;
                    break;
                }
                return ffmpeg_error(ret, "av_read_frame");
            }

            if (pkt->stream_index == stream_idx) {
                break;
            }
            av_packet_unref(pkt);
        }

        if (flushing) {
            continue;
        }

        ret = avcodec_send_packet(codec_ctx, pkt);
        av_packet_unref(pkt);

        // Corrupt packets inside an otherwise valid mp3 are skipped
        if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
            return ffmpeg_error(ret, "avcodec_send_packet");
        }
    }
}

} // namespace impl
} // namespace smp
