// Tests for word timestamp alignment against request text

#include <QtTest>

#include "../common/test_base.h"

#include "core/speech/captioned_speech_client.h"
#include "core/speech/word_alignment.h"

#include <QJsonDocument>
#include <QJsonObject>

using namespace lector;

namespace {

RawWordTimestamp raw(const QString& word, double start, double end)
{
    RawWordTimestamp entry;
    entry.word = word;
    entry.startSeconds = start;
    entry.endSeconds = end;
    return entry;
}

} // namespace

class TestWordAlignment : public TestBase {
    Q_OBJECT

private slots:
    // ── Normalization ──

    void test_all_caps_runs_folded() {
        QCOMPARE(normalizeText("The NASA probe"), QString("The nasa probe"));
        QCOMPARE(normalizeText("I said OK."), QString("I said ok."));
    }

    void test_single_capitals_kept() {
        QCOMPARE(normalizeText("A cat. I ran."), QString("A cat. I ran."));
    }

    void test_punctuation_only() {
        QVERIFY(isPunctuationOnly(","));
        QVERIFY(isPunctuationOnly("..."));
        QVERIFY(!isPunctuationOnly("don't"));
        QVERIFY(!isPunctuationOnly("42"));
    }

    // ── firstMatch ──

    void test_exact_word() {
        auto range = firstMatch("Hello", "Hello world", 0);
        QVERIFY(range.has_value());
        QCOMPARE(range->start, 0);
        QCOMPARE(range->end, 5);
    }

    void test_skips_leading_text() {
        auto range = firstMatch("world", "Hello world", 5);
        QVERIFY(range.has_value());
        QCOMPARE(range->start, 6);
        QCOMPARE(range->end, 11);
    }

    void test_tolerates_spelling_difference() {
        // Service and text spell the word differently
        auto range = firstMatch("colour", "the color red", 3);
        QVERIFY(range.has_value());
        QCOMPARE(range->start, 4);
        QCOMPARE(range->end, 9);
    }

    void test_empty_needle_has_no_match() {
        QVERIFY(!firstMatch("", "abc", 0).has_value());
    }

    // ── alignWordTimestamps ──

    void test_words_aligned_in_order() {
        auto words = alignWordTimestamps("Hello, world!", {
            raw("Hello", 0.0, 0.4), raw(",", 0.4, 0.45), raw("world", 0.5, 0.9), raw("!", 0.9, 1.0),
        });
        QCOMPARE(static_cast<int>(words.size()), 2);
        QVERIFY(words[0].textRange == (TextRange{0, 5}));
        QVERIFY(words[1].textRange == (TextRange{7, 12}));
        QCOMPARE(words[1].timeRange.start, sec(0.5));
        QCOMPARE(words[1].timeRange.end, sec(0.9));
    }

    void test_repeated_words_advance() {
        auto words = alignWordTimestamps("the cat and the dog", {
            raw("the", 0.0, 0.1), raw("cat", 0.1, 0.3), raw("and", 0.3, 0.4),
            raw("the", 0.4, 0.5), raw("dog", 0.5, 0.8),
        });
        QCOMPARE(static_cast<int>(words.size()), 5);
        QVERIFY(words[3].textRange == (TextRange{12, 15}));
        QVERIFY(words[4].textRange == (TextRange{16, 19}));
    }

    void test_caps_text_matches_lowercase_service_word() {
        auto words = alignWordTimestamps("Visit NASA today", {
            raw("Visit", 0.0, 0.3), raw("nasa", 0.3, 0.7), raw("today", 0.7, 1.0),
        });
        QCOMPARE(static_cast<int>(words.size()), 3);
        QVERIFY(words[1].textRange == (TextRange{6, 10}));
    }

    void test_explicit_offsets_win() {
        RawWordTimestamp entry = raw("zzz", 0.0, 0.5);
        entry.startChar = 6;
        entry.endChar = 11;
        auto words = alignWordTimestamps("Hello world", {entry});
        QCOMPARE(static_cast<int>(words.size()), 1);
        QVERIFY(words[0].textRange == (TextRange{6, 11}));
    }

    void test_explicit_offsets_clamped() {
        RawWordTimestamp entry = raw("world", 0.0, 0.5);
        entry.startChar = 6;
        entry.endChar = 40;
        auto words = alignWordTimestamps("Hello world", {entry});
        QVERIFY(words[0].textRange == (TextRange{6, 11}));
    }

    // ── JSON ──

    void test_parse_header_payload() {
        auto parsed = parseWordTimestamps(
            R"([{"word":"Hi","start_time":0.1,"end_time":0.3},)"
            R"({"word":"there","start_time":0.3,"end_time":0.6,"start_char":3,"end_char":8}])");
        QVERIFY(parsed.is_ok());
        QCOMPARE(static_cast<int>(parsed.value().size()), 2);
        QVERIFY(!parsed.value()[0].hasOffsets());
        QVERIFY(parsed.value()[1].hasOffsets());
        QCOMPARE(parsed.value()[1].endSeconds, 0.6);
    }

    void test_parse_rejects_malformed() {
        QVERIFY(parseWordTimestamps("not json").is_error());
        QVERIFY(parseWordTimestamps(R"({"word":"x"})").is_error());
        QVERIFY(parseWordTimestamps(R"([{"word":"x"}])").is_error());
    }

    // ── Speech client wire format ──

    void test_request_body() {
        NarrationConfig config = defaultConfig();
        config.langCode = "a";
        CaptionedSpeechClient client(config);

        QJsonObject body = QJsonDocument::fromJson(client.requestBody("Hello")).object();
        QCOMPARE(body.value("model").toString(), QString("kokoro"));
        QCOMPARE(body.value("input").toString(), QString("Hello"));
        QCOMPARE(body.value("voice").toString(), QString("af_heart"));
        QCOMPARE(body.value("speed").toDouble(), 1.0);
        QCOMPARE(body.value("lang_code").toString(), QString("a"));
        QCOMPARE(body.value("response_format").toString(), QString("mp3"));
        QCOMPARE(body.value("return_download_link").toBool(true), false);
    }

    void test_lang_code_omitted_when_empty() {
        CaptionedSpeechClient client(defaultConfig());
        QJsonObject body = QJsonDocument::fromJson(client.requestBody("Hello")).object();
        QVERIFY(!body.contains("lang_code"));
        QCOMPARE(client.speechUrl().toString(), QString("http://127.0.0.1:8880/dev/captioned_speech"));
        QCOMPARE(client.timestampsUrl("abc.json").toString(),
                 QString("http://127.0.0.1:8880/dev/timestamps/abc.json"));
    }

    void test_error_message_from_detail() {
        QCOMPARE(CaptionedSpeechClient::errorMessage(R"({"detail":{"message":"Voice not found"}})"),
                 QString("Voice not found"));
        QCOMPARE(CaptionedSpeechClient::errorMessage("<html>"), QString("Failed to generate speech"));
    }
};

QTEST_MAIN(TestWordAlignment)
#include "test_word_alignment.moc"
