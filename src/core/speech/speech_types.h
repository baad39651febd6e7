#pragma once

#include <stream_media_platform/smp_time.h>

#include <QByteArray>
#include <QLoggingCategory>
#include <QString>

#include <vector>

Q_DECLARE_LOGGING_CATEGORY(lectorSpeech)

namespace lector {

// Half-open character range [start, end) into a segment's text
struct TextRange {
    int start = 0;
    int end = 0;

    bool empty() const { return end <= start; }
    bool operator==(const TextRange& other) const { return start == other.start && end == other.end; }
    bool operator!=(const TextRange& other) const { return !(*this == other); }
};

// One spoken word: time relative to its chunk, text relative to the request
struct WordTimestamp {
    smp::TimeSpan timeRange;
    TextRange textRange;
};

// Word entry as reported by the speech service, before alignment
struct RawWordTimestamp {
    QString word;
    double startSeconds = 0.0;
    double endSeconds = 0.0;
    int startChar = -1;  // explicit offsets when the service provides them
    int endChar = -1;

    bool hasOffsets() const { return startChar >= 0 && endChar >= startChar; }
};

// A fully drained speech response
struct TtsResponse {
    QString text;
    QString contentType;
    QByteArray content;
    std::vector<WordTimestamp> wordTimestamps;
};

} // namespace lector
