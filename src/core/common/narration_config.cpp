#include "narration_config.h"

#include <QFileInfo>
#include <QSettings>
#include <QUrl>

Q_LOGGING_CATEGORY(lectorConfig, "lector.config")

namespace lector {

namespace {

// Reads key as an int within [minValue, maxValue]; keeps *target otherwise
void readInt(QSettings& settings, const char* key, int minValue, int maxValue, int* target)
{
    if (!settings.contains(key)) {
        return;
    }
    bool ok = false;
    int value = settings.value(key).toInt(&ok);
    if (!ok || value < minValue || value > maxValue) {
        qCWarning(lectorConfig, "Ignoring %s=%s (expected %d..%d)", key,
                  qPrintable(settings.value(key).toString()), minValue, maxValue);
        return;
    }
    *target = value;
}

void readString(QSettings& settings, const char* key, QString* target)
{
    if (settings.contains(key)) {
        *target = settings.value(key).toString().trimmed();
    }
}

} // namespace

NarrationConfig defaultConfig()
{
    NarrationConfig config;
    config.apiUrl = QStringLiteral("http://127.0.0.1:8880");
    config.voice = QStringLiteral("af_heart");
    config.speed = 1.0;
    config.responseFormat = QStringLiteral("mp3");
    config.maxAttempts = 3;

    config.slidingWindowSeconds = 30;
    config.aggressiveWindowSeconds = 15;
    config.quotaMegabytes = 12;

    config.sampleRate = 48000;
    config.channels = 2;
    config.bufferMs = 100;

    config.highlightIntervalMs = 16;
    config.hoverThrottleMs = 33;
    return config;
}

bool setApiUrl(NarrationConfig* config, const QString& value)
{
    QUrl url(value.trimmed(), QUrl::StrictMode);
    if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https") || url.host().isEmpty()) {
        qCWarning(lectorConfig, "Ignoring api url '%s'", qPrintable(value));
        return false;
    }
    QString normalized = url.toString();
    while (normalized.endsWith('/')) {
        normalized.chop(1);
    }
    config->apiUrl = normalized;
    return true;
}

bool setSpeed(NarrationConfig* config, const QString& value)
{
    bool ok = false;
    double speed = value.toDouble(&ok);
    if (!ok || speed < 0.25 || speed > 4.0) {
        qCWarning(lectorConfig, "Ignoring speed '%s' (expected 0.25..4.0)", qPrintable(value));
        return false;
    }
    config->speed = speed;
    return true;
}

bool loadConfigFile(const QString& path, NarrationConfig* config)
{
    if (!QFileInfo::exists(path)) {
        qCWarning(lectorConfig, "Config file not found: %s", qPrintable(path));
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lectorConfig, "Config file unreadable: %s", qPrintable(path));
        return false;
    }

    if (settings.contains("speech/api_url")) {
        setApiUrl(config, settings.value("speech/api_url").toString());
    }
    readString(settings, "speech/voice", &config->voice);
    if (settings.contains("speech/speed")) {
        setSpeed(config, settings.value("speech/speed").toString());
    }
    readString(settings, "speech/lang_code", &config->langCode);
    readString(settings, "speech/response_format", &config->responseFormat);
    readInt(settings, "speech/max_attempts", 1, 10, &config->maxAttempts);

    readInt(settings, "buffer/sliding_window_s", 1, 3600, &config->slidingWindowSeconds);
    readInt(settings, "buffer/aggressive_window_s", 0, 3600, &config->aggressiveWindowSeconds);
    readInt(settings, "buffer/quota_mb", 1, 1024, &config->quotaMegabytes);

    readInt(settings, "output/sample_rate", 8000, 192000, &config->sampleRate);
    readInt(settings, "output/channels", 1, 8, &config->channels);
    readInt(settings, "output/buffer_ms", 10, 2000, &config->bufferMs);

    readInt(settings, "sync/highlight_interval_ms", 1, 1000, &config->highlightIntervalMs);
    readInt(settings, "sync/hover_throttle_ms", 0, 1000, &config->hoverThrottleMs);

    if (config->aggressiveWindowSeconds > config->slidingWindowSeconds) {
        qCWarning(lectorConfig, "aggressive_window_s > sliding_window_s, clamping");
        config->aggressiveWindowSeconds = config->slidingWindowSeconds;
    }

    qCInfo(lectorConfig, "Loaded config %s", qPrintable(path));
    return true;
}

void applyEnvironment(const QProcessEnvironment& env, NarrationConfig* config)
{
    if (env.contains("LECTOR_API_URL")) {
        setApiUrl(config, env.value("LECTOR_API_URL"));
    }
    if (env.contains("LECTOR_VOICE")) {
        QString voice = env.value("LECTOR_VOICE").trimmed();
        if (!voice.isEmpty()) {
            config->voice = voice;
        }
    }
    if (env.contains("LECTOR_SPEED")) {
        setSpeed(config, env.value("LECTOR_SPEED"));
    }
}

} // namespace lector
