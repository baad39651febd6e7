#pragma once

#include "speech_types.h"

#include <stream_media_platform/smp_errors.h>

#include <QByteArray>
#include <QString>

#include <optional>
#include <vector>

namespace lector {

// Lower-case runs of two or more capitals; length and offsets preserved
QString normalizeText(const QString& text);

// True for entries like "," or "..." that have no spoken counterpart
bool isPunctuationOnly(const QString& word);

/**
 * Approximate location of needle in haystack at or after offset.
 *
 * Widens a window of haystack starting at offset until a character diff
 * against needle no longer ends in unmatched needle text (or the haystack
 * runs out). The range spans the first through last needle-aligned
 * character. Returns nullopt when nothing aligns.
 */
std::optional<TextRange> firstMatch(const QString& needle, const QString& haystack, int offset);

/**
 * Map service word entries onto character ranges of text.
 * Explicit offsets win; otherwise fuzzy matching on the normalized text.
 * Punctuation-only entries are skipped. An unmatched content word (not
 * the final entry) gets an empty range at the best-guess offset.
 */
std::vector<WordTimestamp> alignWordTimestamps(const QString& text,
                                               const std::vector<RawWordTimestamp>& raw);

// Parse a JSON array of {word, start_time, end_time[, start_char, end_char]}
smp::Result<std::vector<RawWordTimestamp>> parseWordTimestamps(const QByteArray& json);

} // namespace lector
