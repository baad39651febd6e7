#include "text_segment.h"

#include <QRegularExpression>

namespace lector {

int TextSegment::length() const
{
    int total = 0;
    for (const QString& run : runs) {
        total += static_cast<int>(run.size());
    }
    return total;
}

int documentLength(const std::vector<TextSegment>& segments)
{
    int total = 0;
    for (const TextSegment& segment : segments) {
        total += segment.length();
    }
    return total;
}

QVector<RunSpan> mapRangeToRuns(const TextSegment& segment, const TextRange& range)
{
    QVector<RunSpan> spans;
    int offset = 0;
    bool started = false;

    // Algorithm: skip runs ending at or before start → collect through the run reaching end
    for (int i = 0; i < segment.runs.size(); ++i) {
        const int runLength = static_cast<int>(segment.runs.at(i).size());
        if (!started && offset + runLength <= range.start) {
            offset += runLength;
            continue;
        }

        RunSpan span;
        span.run = i;
        span.start = started ? 0 : range.start - offset;
        started = true;

        if (offset + runLength >= range.end) {
            span.end = range.end - offset;
            spans.append(span);
            return spans;
        }
        span.end = runLength;
        spans.append(span);
        offset += runLength;
    }

    // Range runs past the segment
    return QVector<RunSpan>();
}

std::vector<TextSegment> PlainTextExtractor::extractText()
{
    static const QRegularExpression blankLines(QStringLiteral("\\n[ \\t]*\\n"));

    QString document = m_document;
    document.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));

    std::vector<TextSegment> segments;
    const QStringList paragraphs = document.split(blankLines);
    for (const QString& paragraph : paragraphs) {
        if (paragraph.trimmed().isEmpty()) {
            continue;
        }

        QString body = paragraph;
        while (body.startsWith(QLatin1Char('\n'))) {
            body.remove(0, 1);
        }
        while (body.endsWith(QLatin1Char('\n'))) {
            body.chop(1);
        }

        TextSegment segment;
        const QStringList lines = body.split(QLatin1Char('\n'));
        for (int i = 0; i < lines.size(); ++i) {
            segment.runs << (i + 1 < lines.size() ? lines.at(i) + QLatin1Char('\n') : lines.at(i));
        }
        segments.push_back(segment);
    }
    return segments;
}

} // namespace lector
