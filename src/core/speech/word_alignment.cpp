#include "word_alignment.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>

#include <algorithm>

namespace lector {

namespace {

enum class DiffOp { Equal, Delete, Insert };

// Character diff of window (haystack side) against needle.
// Reports the first and past-last needle-aligned window positions and the
// kind of the final operation.
struct DiffSummary {
    int start = -1;     // relative to window start
    int end = -1;
    int consumed = 0;   // window characters consumed when nothing aligned
    DiffOp last = DiffOp::Equal;
    bool any = false;
};

DiffSummary diffWindow(const QString& window, const QString& needle)
{
    const int n = static_cast<int>(window.size());
    const int m = static_cast<int>(needle.size());

    // lcs[i][j]: LCS length of window[i..] and needle[j..]
    std::vector<int> lcs(static_cast<size_t>((n + 1) * (m + 1)), 0);
    auto at = [m](int i, int j) { return static_cast<size_t>(i * (m + 1) + j); };
    for (int i = n - 1; i >= 0; --i) {
        for (int j = m - 1; j >= 0; --j) {
            lcs[at(i, j)] = window.at(i) == needle.at(j)
                ? lcs[at(i + 1, j + 1)] + 1
                : std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
        }
    }

    DiffSummary summary;
    int pos = 0;
    auto note = [&](DiffOp op) {
        summary.any = true;
        summary.last = op;
        if (op == DiffOp::Delete) {
            ++pos;
            return;
        }
        if (summary.start < 0) {
            summary.start = pos;
        }
        if (op == DiffOp::Equal) {
            ++pos;
        }
        summary.end = pos;
    };

    int i = 0;
    int j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && window.at(i) == needle.at(j)) {
            note(DiffOp::Equal);
            ++i;
            ++j;
        } else if (i < n && (j >= m || lcs[at(i + 1, j)] >= lcs[at(i, j + 1)])) {
            note(DiffOp::Delete);
            ++i;
        } else {
            note(DiffOp::Insert);
            ++j;
        }
    }
    summary.consumed = pos;
    return summary;
}

} // namespace

QString normalizeText(const QString& text)
{
    QString out = text;
    int i = 0;
    const int n = static_cast<int>(out.size());
    while (i < n) {
        if (!out.at(i).isLetter()) {
            ++i;
            continue;
        }
        int wordEnd = i;
        bool allUpper = true;
        while (wordEnd < n && out.at(wordEnd).isLetter()) {
            if (!out.at(wordEnd).isUpper()) {
                allUpper = false;
            }
            ++wordEnd;
        }
        if (allUpper && wordEnd - i >= 2) {
            for (int k = i; k < wordEnd; ++k) {
                out[k] = out.at(k).toLower();
            }
        }
        i = wordEnd;
    }
    return out;
}

bool isPunctuationOnly(const QString& word)
{
    static const QRegularExpression punctuation(QStringLiteral("^[^A-Za-z0-9_]+$"));
    return punctuation.match(word).hasMatch();
}

std::optional<TextRange> firstMatch(const QString& needle, const QString& haystack, int offset)
{
    const int length = static_cast<int>(haystack.size());
    offset = std::clamp(offset, 0, length);

    for (int i = std::min(offset + static_cast<int>(needle.size()), length); i <= length; ++i) {
        DiffSummary diff = diffWindow(haystack.mid(offset, i - offset), needle);

        // Unmatched needle text at the end: widen while haystack remains
        if (i + 1 <= length && diff.any && diff.last == DiffOp::Insert) {
            continue;
        }

        if (diff.start >= 0 && diff.end >= 0) {
            return TextRange{offset + diff.start, offset + diff.end};
        }
        offset += diff.consumed;
    }
    return std::nullopt;
}

std::vector<WordTimestamp> alignWordTimestamps(const QString& text,
                                               const std::vector<RawWordTimestamp>& raw)
{
    const QString haystack = normalizeText(text);
    const int length = static_cast<int>(haystack.size());

    std::vector<WordTimestamp> words;
    words.reserve(raw.size());
    int offset = 0;

    for (size_t i = 0; i < raw.size(); ++i) {
        const RawWordTimestamp& entry = raw[i];
        if (isPunctuationOnly(entry.word)) {
            continue;
        }

        TextRange range;
        if (entry.hasOffsets()) {
            range.start = std::clamp(entry.startChar, 0, length);
            range.end = std::clamp(entry.endChar, range.start, length);
        } else {
            std::optional<TextRange> match = firstMatch(normalizeText(entry.word), haystack, offset);
            if (!match) {
                continue;
            }
            range = *match;
            if (range.start == length && i + 1 < raw.size()) {
                qCWarning(lectorSpeech, "No text range for word \"%s\"", qPrintable(entry.word));
                int guess = std::min(offset + static_cast<int>(entry.word.size()), length);
                range = TextRange{guess, guess};
            }
        }

        WordTimestamp word;
        word.timeRange.start = smp::seconds_to_us(entry.startSeconds);
        word.timeRange.end = smp::seconds_to_us(entry.endSeconds);
        word.textRange = range;
        words.push_back(word);
        offset = range.end;
    }
    return words;
}

smp::Result<std::vector<RawWordTimestamp>> parseWordTimestamps(const QByteArray& json)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return smp::Error::invalid_arg("word timestamps: " + parseError.errorString().toStdString());
    }
    if (!doc.isArray()) {
        return smp::Error::invalid_arg("word timestamps: expected a JSON array");
    }

    std::vector<RawWordTimestamp> entries;
    const QJsonArray array = doc.array();
    entries.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (!value.isObject()) {
            return smp::Error::invalid_arg("word timestamps: entry is not an object");
        }
        QJsonObject obj = value.toObject();
        if (!obj.value("word").isString() || !obj.value("start_time").isDouble() ||
            !obj.value("end_time").isDouble()) {
            return smp::Error::invalid_arg("word timestamps: entry missing word/start_time/end_time");
        }

        RawWordTimestamp entry;
        entry.word = obj.value("word").toString();
        entry.startSeconds = obj.value("start_time").toDouble();
        entry.endSeconds = obj.value("end_time").toDouble();
        if (obj.value("start_char").isDouble() && obj.value("end_char").isDouble()) {
            entry.startChar = obj.value("start_char").toInt();
            entry.endChar = obj.value("end_char").toInt();
        }
        entries.push_back(entry);
    }
    return entries;
}

} // namespace lector
