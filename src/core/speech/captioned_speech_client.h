#pragma once

#include "speech_service.h"

#include "common/narration_config.h"

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;

namespace lector {

/**
 * Response body of a QNetworkReply as a ByteStream. Takes ownership of
 * the reply. Data buffered before start() is delivered first.
 */
class NetworkByteStream : public ByteStream
{
    Q_OBJECT

public:
    explicit NetworkByteStream(QNetworkReply* reply, QObject* parent = nullptr);
    ~NetworkByteStream() override;

    void start() override;
    void abort() override;

private:
    void onReadyRead();
    void onFinished();

    QNetworkReply* m_reply;
    bool m_started = false;
    bool m_done = false;
};

/**
 * Speech service speaking the captioned-speech HTTP API:
 *   POST {api}/dev/captioned_speech  →  audio body
 * Word timestamps come from the X-Word-Timestamps header, or from
 * GET {api}/dev/timestamps/<X-Timestamps-Path>.
 */
class CaptionedSpeechClient : public QObject, public SpeechService
{
    Q_OBJECT

public:
    explicit CaptionedSpeechClient(const NarrationConfig& config, QObject* parent = nullptr);
    ~CaptionedSpeechClient() override;

    std::unique_ptr<SpeechRequest> createSpeech(const QString& text, ReplyFn done) override;

    QByteArray requestBody(const QString& text) const;
    QUrl speechUrl() const;
    QUrl timestampsUrl(const QString& path) const;

    // detail.message of a JSON error body, or the generic message
    static QString errorMessage(const QByteArray& body);

private:
    NarrationConfig m_config;
    QNetworkAccessManager* m_network;
};

} // namespace lector
