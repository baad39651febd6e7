#pragma once

#include "speech/speech_types.h"

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

#include <vector>

namespace lector {

// One paragraph-like unit of narrated text, split into display runs
struct TextSegment {
    QStringList runs;

    QString text() const { return runs.join(QString()); }
    int length() const;
};

// Portion of one run covered by a highlighted word
struct RunSpan {
    int run = 0;
    int start = 0;
    int end = 0;

    bool operator==(const RunSpan& other) const
    {
        return run == other.run && start == other.start && end == other.end;
    }
};

struct WordHighlight {
    int segment = -1;
    TextRange textRange;
    QVector<RunSpan> runs;
};

// Character count of the whole document; text indices address [0, length)
int documentLength(const std::vector<TextSegment>& segments);

// Map a segment-relative character range onto the runs it touches.
// Empty when the range lies outside the segment.
QVector<RunSpan> mapRangeToRuns(const TextSegment& segment, const TextRange& range);

class TextExtractor
{
public:
    virtual ~TextExtractor() = default;
    virtual std::vector<TextSegment> extractText() = 0;
};

/**
 * Plain-text documents: paragraphs separated by blank lines, each line a
 * run (line breaks kept at the end of all but the last line).
 * Whitespace-only paragraphs are dropped.
 */
class PlainTextExtractor : public TextExtractor
{
public:
    explicit PlainTextExtractor(const QString& document) : m_document(document) {}

    std::vector<TextSegment> extractText() override;

private:
    QString m_document;
};

} // namespace lector

Q_DECLARE_METATYPE(lector::WordHighlight)
