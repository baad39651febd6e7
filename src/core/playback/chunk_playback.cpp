#include "chunk_playback.h"

#include <stream_media_platform/smp_source_buffer.h>

namespace lector {

SinkPlaybackFactory::SinkPlaybackFactory(std::shared_ptr<smp::SharedOutput> output,
                                         size_t quotaBytes,
                                         const AppenderConfig& appenderConfig)
    : m_output(std::move(output))
    , m_quotaBytes(quotaBytes)
    , m_appenderConfig(appenderConfig)
{
}

ChunkPlayback SinkPlaybackFactory::create(const AudioChunk& chunk)
{
    auto buffer = std::make_shared<smp::PcmSourceBuffer>(m_output->format, m_quotaBytes);
    auto handle = std::make_unique<smp::SinkMediaHandle>(buffer, m_output);

    smp::MediaHandle* rawHandle = handle.get();
    auto appender = std::make_unique<ChunkBufferAppender>(
        buffer, [rawHandle]() { return rawHandle->CurrentTime(); }, m_appenderConfig);

    // Data flows compositor → appender → handle
    smp::Result<void> result = appender->append(chunk.mimeType, chunk.bytes);
    if (result.is_error()) {
        qCWarning(lectorAppender, "Chunk at %lld not appended: %s",
                  static_cast<long long>(chunk.span.start), result.error().describe().c_str());
    }
    appender->end();

    ChunkPlayback playback;
    playback.handle = std::move(handle);
    playback.appender = std::move(appender);
    return playback;
}

} // namespace lector
