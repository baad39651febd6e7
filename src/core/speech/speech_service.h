#pragma once

#include "byte_stream.h"
#include "speech_types.h"

#include <stream_media_platform/smp_errors.h>

#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace lector {

// Response headers are in; the body is still streaming
struct SpeechReply {
    QString text;
    QString contentType;
    std::unique_ptr<ByteStream> body;
    std::vector<WordTimestamp> wordTimestamps;
};

// In-flight speech call. Destroying it aborts the call.
class SpeechRequest
{
public:
    virtual ~SpeechRequest() = default;
    virtual void abort() = 0;
};

/**
 * Remote text-to-speech contract. done runs exactly once on the caller's
 * thread unless the request is aborted first.
 */
class SpeechService
{
public:
    using ReplyFn = std::function<void(smp::Result<SpeechReply>)>;

    virtual ~SpeechService() = default;
    virtual std::unique_ptr<SpeechRequest> createSpeech(const QString& text, ReplyFn done) = 0;
};

} // namespace lector
