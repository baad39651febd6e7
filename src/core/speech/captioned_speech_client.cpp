#include "captioned_speech_client.h"

#include "word_alignment.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace lector {

namespace {

const char* const kDefaultContentType = "audio/mpeg";

smp::Error replyError(QNetworkReply* reply)
{
    return smp::Error::network(reply->errorString().toStdString());
}

/**
 * One captioned-speech call: headers → (optional timestamps fetch) → done.
 * The body reply is handed to a NetworkByteStream on success.
 */
class CaptionedSpeechRequest : public QObject, public SpeechRequest
{
public:
    CaptionedSpeechRequest(CaptionedSpeechClient* client, QNetworkAccessManager* network,
                           const QString& text, SpeechService::ReplyFn done)
        : m_client(client)
        , m_network(network)
        , m_text(text)
        , m_done(std::move(done))
    {
    }

    ~CaptionedSpeechRequest() override
    {
        abort();
    }

    void send()
    {
        QNetworkRequest request(m_client->speechUrl());
        request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

        m_reply = m_network->post(request, m_client->requestBody(m_text));
        connect(m_reply, &QNetworkReply::metaDataChanged, this, &CaptionedSpeechRequest::onHeaders);
        connect(m_reply, &QNetworkReply::finished, this, &CaptionedSpeechRequest::onReplyFinished);
    }

    void abort() override
    {
        if (m_finished) {
            return;
        }
        m_finished = true;
        dropReply(m_timestampsReply);
        dropReply(m_reply);
    }

private:
    static void dropReply(QPointer<QNetworkReply>& reply)
    {
        if (!reply) {
            return;
        }
        reply->disconnect();
        reply->abort();
        reply->deleteLater();
        reply.clear();
    }

    int statusCode() const
    {
        return m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    }

    void onHeaders()
    {
        if (m_finished || m_headersSeen) {
            return;
        }
        int status = statusCode();
        if (status == 0) {
            return;
        }
        m_headersSeen = true;

        // Error bodies are read in full before reporting
        if (status < 200 || status >= 300) {
            m_httpError = true;
            return;
        }

        if (m_reply->hasRawHeader("X-Word-Timestamps")) {
            finishTimestamps(m_reply->rawHeader("X-Word-Timestamps"));
            return;
        }
        if (m_reply->hasRawHeader("X-Timestamps-Path")) {
            QString path = QString::fromUtf8(m_reply->rawHeader("X-Timestamps-Path"));
            qCDebug(lectorSpeech, "Fetching word timestamps from %s", qPrintable(path));
            m_timestampsReply = m_network->get(QNetworkRequest(m_client->timestampsUrl(path)));
            connect(m_timestampsReply, &QNetworkReply::finished, this, [this]() {
                QPointer<QNetworkReply> reply = m_timestampsReply;
                m_timestampsReply.clear();
                reply->deleteLater();
                if (reply->error() != QNetworkReply::NoError) {
                    fail(replyError(reply));
                    return;
                }
                finishTimestamps(reply->readAll());
            });
            return;
        }
        succeed(std::vector<WordTimestamp>());
    }

    void onReplyFinished()
    {
        if (m_finished) {
            return;
        }
        if (!m_headersSeen) {
            onHeaders();
            if (m_finished) {
                return;
            }
        }

        if (m_httpError) {
            QByteArray body = m_reply->readAll();
            fail(smp::Error::service(CaptionedSpeechClient::errorMessage(body).toStdString()));
            return;
        }
        if (m_reply->error() != QNetworkReply::NoError && !m_timestampsReply) {
            fail(replyError(m_reply));
        }
        // Otherwise the body stream (or a pending timestamps fetch) owns completion
    }

    void finishTimestamps(const QByteArray& json)
    {
        auto raw = parseWordTimestamps(json);
        if (raw.is_error()) {
            fail(raw.error());
            return;
        }
        succeed(alignWordTimestamps(m_text, raw.value()));
    }

    void succeed(std::vector<WordTimestamp> words)
    {
        if (m_finished) {
            return;
        }
        m_finished = true;

        SpeechReply reply;
        reply.text = m_text;
        reply.contentType = m_reply->header(QNetworkRequest::ContentTypeHeader).toString();
        if (reply.contentType.isEmpty()) {
            reply.contentType = QString::fromLatin1(kDefaultContentType);
        }
        reply.wordTimestamps = std::move(words);

        QNetworkReply* body = m_reply;
        body->disconnect(this);
        m_reply.clear();
        reply.body = std::make_unique<NetworkByteStream>(body);

        qCDebug(lectorSpeech, "Speech headers received (%s, %d words)",
                qPrintable(reply.contentType), static_cast<int>(reply.wordTimestamps.size()));
        auto done = std::move(m_done);
        done(std::move(reply));
    }

    void fail(const smp::Error& error)
    {
        if (m_finished) {
            return;
        }
        abort();
        auto done = std::move(m_done);
        done(error);
    }

    CaptionedSpeechClient* m_client;
    QNetworkAccessManager* m_network;
    QString m_text;
    SpeechService::ReplyFn m_done;

    QPointer<QNetworkReply> m_reply;
    QPointer<QNetworkReply> m_timestampsReply;
    bool m_headersSeen = false;
    bool m_httpError = false;
    bool m_finished = false;
};

} // namespace

// ============================================================================
// NetworkByteStream
// ============================================================================

NetworkByteStream::NetworkByteStream(QNetworkReply* reply, QObject* parent)
    : ByteStream(parent)
    , m_reply(reply)
{
    m_reply->setParent(this);
}

NetworkByteStream::~NetworkByteStream()
{
    abort();
}

void NetworkByteStream::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    connect(m_reply, &QNetworkReply::readyRead, this, &NetworkByteStream::onReadyRead);
    connect(m_reply, &QNetworkReply::finished, this, &NetworkByteStream::onFinished);

    // Deliver what arrived before start() on the next turn of the loop
    QTimer::singleShot(0, this, [this]() {
        if (m_done) {
            return;
        }
        onReadyRead();
        if (m_reply->isFinished()) {
            onFinished();
        }
    });
}

void NetworkByteStream::abort()
{
    if (m_done) {
        return;
    }
    m_done = true;
    m_reply->disconnect(this);
    m_reply->abort();
}

void NetworkByteStream::onReadyRead()
{
    if (m_done) {
        return;
    }
    QByteArray data = m_reply->readAll();
    if (!data.isEmpty()) {
        emit dataReceived(data);
    }
}

void NetworkByteStream::onFinished()
{
    if (m_done) {
        return;
    }
    onReadyRead();
    m_done = true;
    if (m_reply->error() != QNetworkReply::NoError) {
        emit failed(replyError(m_reply));
        return;
    }
    emit finished();
}

// ============================================================================
// CaptionedSpeechClient
// ============================================================================

CaptionedSpeechClient::CaptionedSpeechClient(const NarrationConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_network(new QNetworkAccessManager(this))
{
}

CaptionedSpeechClient::~CaptionedSpeechClient() = default;

std::unique_ptr<SpeechRequest> CaptionedSpeechClient::createSpeech(const QString& text, ReplyFn done)
{
    auto request = std::make_unique<CaptionedSpeechRequest>(this, m_network, text, std::move(done));
    request->send();
    return request;
}

QByteArray CaptionedSpeechClient::requestBody(const QString& text) const
{
    QJsonObject body;
    body["model"] = "kokoro";
    body["input"] = text;
    body["voice"] = m_config.voice;
    body["speed"] = m_config.speed;
    if (!m_config.langCode.isEmpty()) {
        body["lang_code"] = m_config.langCode;
    }
    body["response_format"] = m_config.responseFormat;
    body["return_download_link"] = false;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QUrl CaptionedSpeechClient::speechUrl() const
{
    return QUrl(m_config.apiUrl + QStringLiteral("/dev/captioned_speech"));
}

QUrl CaptionedSpeechClient::timestampsUrl(const QString& path) const
{
    return QUrl(m_config.apiUrl + QStringLiteral("/dev/timestamps/") + path);
}

QString CaptionedSpeechClient::errorMessage(const QByteArray& body)
{
    QJsonDocument doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        QJsonValue message = doc.object().value("detail").toObject().value("message");
        if (message.isString() && !message.toString().isEmpty()) {
            return message.toString();
        }
    }
    return QStringLiteral("Failed to generate speech");
}

} // namespace lector
