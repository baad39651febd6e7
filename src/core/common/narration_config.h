#pragma once

#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lectorConfig)

namespace lector {

/**
 * NarrationConfig: every tunable of a narration session.
 *
 * Sources, later ones winning:
 * - Built-in defaults (defaultConfig())
 * - INI file, groups speech/ buffer/ output/ sync/
 * - Environment: LECTOR_API_URL, LECTOR_VOICE, LECTOR_SPEED
 * - Command-line options (applied by the caller)
 *
 * Invalid values are rejected with a warning and the previous value kept.
 */
struct NarrationConfig {
    // speech
    QString apiUrl;
    QString voice;
    double speed;
    QString langCode;        // empty: omitted from requests
    QString responseFormat;
    int maxAttempts;

    // buffer
    int slidingWindowSeconds;
    int aggressiveWindowSeconds;
    int quotaMegabytes;

    // output
    int sampleRate;
    int channels;
    int bufferMs;

    // sync
    int highlightIntervalMs;
    int hoverThrottleMs;
};

NarrationConfig defaultConfig();

// Overlay values from an INI file. Missing file: config unchanged, false.
bool loadConfigFile(const QString& path, NarrationConfig* config);

void applyEnvironment(const QProcessEnvironment& env, NarrationConfig* config);

// Individual setters shared by the INI/env/CLI layers; false on rejection
bool setApiUrl(NarrationConfig* config, const QString& value);
bool setSpeed(NarrationConfig* config, const QString& value);

} // namespace lector
