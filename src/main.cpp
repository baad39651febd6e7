#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcessEnvironment>
#include <QTextStream>
#include <QTimer>

#include "assert_handler.h"
#include "audio_output_platform/aop.h"
#include "core/common/narration_config.h"
#include "core/playback/chunk_playback.h"
#include "core/playback/duration_probe.h"
#include "core/playback/timeline_compositor.h"
#include "core/speech/captioned_speech_client.h"
#include "core/speech/segment_source.h"
#include "core/speech/speech_pipeline.h"
#include "core/sync/narration_synchronizer.h"
#include "core/sync/text_segment.h"

#include <stream_media_platform/smp_sink_media_handle.h>

Q_LOGGING_CATEGORY(lectorMain, "lector.main")

int main(int argc, char *argv[])
{
    lector_install_abort_handler();

    QCoreApplication app(argc, argv);
    app.setApplicationName("lector");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Narrates a text file through a text-to-speech service");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", "Plain-text document to narrate");

    QCommandLineOption configOption("config", "INI configuration file", "path");
    QCommandLineOption apiUrlOption("api-url", "Speech service base URL", "url");
    QCommandLineOption voiceOption("voice", "Voice name", "voice");
    QCommandLineOption speedOption("speed", "Speech speed (0.25 - 4.0)", "factor");
    QCommandLineOption langOption("lang", "Language code", "code");
    QCommandLineOption segmentOption("segment", "Start at paragraph N (0-based)", "index");
    QCommandLineOption fromCharOption("from-char", "Start at a character offset", "offset");
    QCommandLineOption verboseOption("verbose", "Debug logging");
    parser.addOptions({configOption, apiUrlOption, voiceOption, speedOption, langOption,
                       segmentOption, fromCharOption, verboseOption});
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption)
        ? QStringLiteral("lector.*=true")
        : QStringLiteral("lector.*.debug=false\nlector.*.info=true"));

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }

    // Configuration: defaults → file → environment → command line
    lector::NarrationConfig config = lector::defaultConfig();
    if (parser.isSet(configOption) && !lector::loadConfigFile(parser.value(configOption), &config)) {
        return 2;
    }
    lector::applyEnvironment(QProcessEnvironment::systemEnvironment(), &config);
    if (parser.isSet(apiUrlOption) && !lector::setApiUrl(&config, parser.value(apiUrlOption))) {
        return 2;
    }
    if (parser.isSet(speedOption) && !lector::setSpeed(&config, parser.value(speedOption))) {
        return 2;
    }
    if (parser.isSet(voiceOption)) {
        config.voice = parser.value(voiceOption);
    }
    if (parser.isSet(langOption)) {
        config.langCode = parser.value(langOption);
    }

    QFile file(positional.first());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCCritical(lectorMain, "Cannot read %s: %s", qPrintable(positional.first()),
                   qPrintable(file.errorString()));
        return 2;
    }
    lector::PlainTextExtractor extractor(QString::fromUtf8(file.readAll()));
    std::vector<lector::TextSegment> segments = extractor.extractText();
    if (segments.empty()) {
        qCCritical(lectorMain, "Nothing to narrate in %s", qPrintable(positional.first()));
        return 2;
    }
    qCInfo(lectorMain, "Narrating %d paragraphs from %s via %s", static_cast<int>(segments.size()),
           qPrintable(QFileInfo(file).fileName()), qPrintable(config.apiUrl));

    QStringList texts;
    for (const auto& segment : segments) {
        texts << segment.text();
    }
    const int totalChars = lector::documentLength(segments);

    bool startOk = true;
    const int segmentIndex = parser.value(segmentOption).toInt(&startOk);
    if (parser.isSet(segmentOption)
        && (!startOk || segmentIndex < 0 || segmentIndex >= static_cast<int>(segments.size()))) {
        qCCritical(lectorMain, "Invalid --segment: %s (document has %d paragraphs)",
                   qPrintable(parser.value(segmentOption)), static_cast<int>(segments.size()));
        return 2;
    }
    const int fromChar = parser.value(fromCharOption).toInt(&startOk);
    if (parser.isSet(fromCharOption) && (!startOk || fromChar < 0 || fromChar >= totalChars)) {
        qCCritical(lectorMain, "Invalid --from-char: %s (document has %d characters)",
                   qPrintable(parser.value(fromCharOption)), totalChars);
        return 2;
    }

    // Output device shared by every chunk
    aop::AopConfig outputConfig{config.sampleRate, config.channels, config.bufferMs};
    std::shared_ptr<smp::SharedOutput> output = smp::OpenSharedOutput(outputConfig);

    lector::AppenderConfig appenderConfig;
    appenderConfig.slidingWindow = config.slidingWindowSeconds * smp::kMicrosPerSecond;
    appenderConfig.aggressiveWindow = config.aggressiveWindowSeconds * smp::kMicrosPerSecond;
    const size_t quotaBytes = static_cast<size_t>(config.quotaMegabytes) * 1024 * 1024;

    lector::TimelineCompositor compositor(
        std::make_unique<lector::SinkPlaybackFactory>(output, quotaBytes, appenderConfig),
        std::make_unique<lector::DecodingDurationProbe>());

    lector::CaptionedSpeechClient client(config);
    lector::PipelineConfig pipelineConfig;
    pipelineConfig.maxAttempts = config.maxAttempts;
    lector::SpeechPipeline pipeline(std::make_unique<lector::ListSegmentSource>(texts),
                                    &client, &compositor, pipelineConfig);

    lector::SyncConfig syncConfig;
    syncConfig.highlightIntervalMs = config.highlightIntervalMs;
    syncConfig.hoverThrottleMs = config.hoverThrottleMs;
    lector::NarrationSynchronizer synchronizer(segments, &compositor, &pipeline, syncConfig);

    QTextStream out(stdout);
    QObject::connect(&synchronizer, &lector::NarrationSynchronizer::wordHighlighted,
                     [&out, &segments](const lector::WordHighlight& highlight) {
                         const QString text = segments[static_cast<size_t>(highlight.segment)].text();
                         out << text.mid(highlight.textRange.start,
                                         highlight.textRange.end - highlight.textRange.start)
                             << ' ' << Qt::flush;
                     });
    QObject::connect(&synchronizer, &lector::NarrationSynchronizer::bufferingStateChanged,
                     [](lector::BufferingState state) {
                         qCInfo(lectorMain, "%s", lector::bufferingStateName(state));
                     });

    bool failed = false;
    QObject::connect(&pipeline, &lector::SpeechPipeline::errorOccurred, [&failed](const smp::Error& error) {
        qCCritical(lectorMain, "Narration failed: %s", error.describe().c_str());
        failed = true;
    });
    // A failure before playback started (or a dropped start request) never reaches Ended
    QObject::connect(&pipeline, &lector::SpeechPipeline::finished, [&app, &out, &pipeline, &compositor]() {
        if (pipeline.failed() && compositor.state() != lector::PlaybackState::Play) {
            out << Qt::endl;
            app.exit(1);
        }
    });
    QObject::connect(&compositor, &lector::TimelineCompositor::stateChanged,
                     [&app, &out, &failed](lector::PlaybackState state) {
                         if (state == lector::PlaybackState::Ended) {
                             out << Qt::endl;
                             app.exit(failed ? 1 : 0);
                         }
                     });

    QTimer::singleShot(0, [&]() {
        pipeline.start();
        if (parser.isSet(segmentOption)) {
            synchronizer.playSegment(segmentIndex);
        } else if (parser.isSet(fromCharOption)) {
            synchronizer.playFromTextIndex(fromChar);
        } else {
            compositor.play();
        }
    });

    int result = app.exec();

    pipeline.dispose();
    compositor.dispose();
    qCInfo(lectorMain, "Narration finished (%d chapters)", static_cast<int>(pipeline.chapters().size()));
    return result;
}
