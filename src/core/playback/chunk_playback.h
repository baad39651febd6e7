#pragma once

#include "chunk_buffer_appender.h"

#include <stream_media_platform/smp_media_handle.h>
#include <stream_media_platform/smp_sink_media_handle.h>

#include <QByteArray>
#include <QString>

#include <memory>

namespace lector {

// One independently decodable piece of the virtual timeline
struct AudioChunk {
    QString mimeType;
    QByteArray bytes;
    smp::TimeSpan span;  // [runningDuration, runningDuration + measured)
};

// Playback primitive for exactly one chunk. The appender is present when
// the handle is fed through a SourceBuffer.
struct ChunkPlayback {
    std::unique_ptr<smp::MediaHandle> handle;
    std::unique_ptr<ChunkBufferAppender> appender;
};

class ChunkPlaybackFactory
{
public:
    virtual ~ChunkPlaybackFactory() = default;
    virtual ChunkPlayback create(const AudioChunk& chunk) = 0;
};

/**
 * Builds PcmSourceBuffer → SinkMediaHandle pairs on a shared output.
 * The chunk's bytes are appended and the buffer finalized immediately;
 * decoding completes asynchronously on the decode pool.
 */
class SinkPlaybackFactory : public ChunkPlaybackFactory
{
public:
    SinkPlaybackFactory(std::shared_ptr<smp::SharedOutput> output,
                        size_t quotaBytes,
                        const AppenderConfig& appenderConfig);

    ChunkPlayback create(const AudioChunk& chunk) override;

private:
    std::shared_ptr<smp::SharedOutput> m_output;
    size_t m_quotaBytes;
    AppenderConfig m_appenderConfig;
};

} // namespace lector
