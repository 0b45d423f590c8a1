#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QTextStream>
#include <cstdio>
#include <exception>
#include <memory>

#include "core/analysis/KeywordStore.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/media/DurationProber.hpp"
#include "core/media/Transcoder.hpp"
#include "core/pipeline/TranscriptionPipeline.hpp"
#include "core/progress/ProgressTracker.hpp"
#include "core/storage/MemoryManager.hpp"
#include "core/transcription/WhisperSpeechModel.hpp"

namespace {

// One line per progress change on stderr; stdout carries the JSON result.
class ConsoleProgressObserver : public Scribe::ProgressObserver {
public:
    void onProgress(const QString& sessionId, const Scribe::SessionProgress& progress) override {
        QTextStream err(stderr);
        err << QString("[%1] %2% %3 - %4")
                   .arg(sessionId)
                   .arg(progress.progress, 5, 'f', 1)
                   .arg(Scribe::sessionStageName(progress.stage), progress.currentTask)
            << Qt::endl;
    }
};

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ScribePipeline");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Scribe");

    QCommandLineParser parser;
    parser.setApplicationDescription("Transcribe a media file in parallel chunks and analyse the transcript.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("media", "Audio or video file to transcribe.");

    const QCommandLineOption modelOption("model", "whisper.cpp model file.", "path");
    const QCommandLineOption keywordsOption("keywords", "Comma separated keywords to look for.", "list");
    const QCommandLineOption scenarioOption("scenario", "Use the keywords of a stored scenario.", "id");
    const QCommandLineOption chunkOption("chunk-seconds", "Requested chunk length in seconds.", "seconds");
    const QCommandLineOption sessionOption("session", "Session name used as id prefix.", "name");
    const QCommandLineOption workDirOption("work-dir", "Directory for chunk and audio files.", "dir");
    const QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    const QCommandLineOption verboseOption("verbose", "Debug logging.");
    parser.addOptions({modelOption, keywordsOption, scenarioOption, chunkOption,
                       sessionOption, workDirOption, configOption, verboseOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        QTextStream(stderr) << parser.helpText();
        return 1;
    }
    const QString mediaPath = positional.first();

    try {
        auto& config = Scribe::Config::instance();
        if (parser.isSet(configOption)) {
            config.initializeFromFile(parser.value(configOption));
        } else {
            config.initialize();
        }

        const auto logging = config.getLoggingSettings();
        Scribe::Logger::instance().initialize(logging.filePath.toStdString(),
            parser.isSet(verboseOption) ? Scribe::Logger::Level::Debug : logging.level);
        SCRIBE_INFO("Starting scribe v{}", app.applicationVersion().toStdString());

        auto validation = config.validate();
        if (validation.hasError()) {
            SCRIBE_CRITICAL("Invalid configuration: {}",
                            Scribe::configErrorToString(validation.error()).toStdString());
            return 1;
        }

        if (!QFileInfo::exists(mediaPath)) {
            SCRIBE_CRITICAL("Media file not found: {}", mediaPath.toStdString());
            return 1;
        }

        auto settings = Scribe::PipelineSettings::fromConfig(config);
        if (parser.isSet(modelOption)) {
            settings.transcription.modelPath = parser.value(modelOption);
        }
        if (settings.transcription.modelPath.isEmpty()) {
            SCRIBE_CRITICAL("No speech model given; use --model or transcription/modelPath");
            return 1;
        }

        Scribe::PipelineRequest request;
        request.sessionName = parser.value(sessionOption);
        request.workDir = parser.value(workDirOption);
        if (parser.isSet(chunkOption)) {
            bool ok = false;
            const int seconds = parser.value(chunkOption).toInt(&ok);
            if (!ok || seconds <= 0) {
                SCRIBE_CRITICAL("--chunk-seconds needs a positive integer");
                return 1;
            }
            request.chunkSeconds = seconds;
        }

        Scribe::KeywordStore keywordStore(settings.storage.keywordsPath, settings.analysis);
        if (parser.isSet(keywordsOption)) {
            request.keywords = Scribe::KeywordSnapshot{
                keywordStore.normalize(parser.value(keywordsOption).split(',', Qt::SkipEmptyParts)),
                QStringLiteral("command line")};
        } else {
            request.keywords = keywordStore.snapshot(parser.value(scenarioOption));
        }
        SCRIBE_INFO("Using {} keywords from {}", request.keywords.keywords.size(),
                    request.keywords.source.toStdString());

        Scribe::PipelineCollaborators collaborators;
        collaborators.prober = std::make_shared<Scribe::FFmpegDurationProber>();
        collaborators.transcoder = std::make_shared<Scribe::FFmpegTranscoder>();
        collaborators.modelFactory = Scribe::WhisperSpeechModel::factory(settings.transcription.modelPath);
        collaborators.telemetry = std::make_shared<Scribe::ProcMemoryTelemetry>();
        collaborators.tracker = std::make_shared<Scribe::ProgressTracker>(
            std::make_shared<ConsoleProgressObserver>());

        Scribe::TranscriptionPipeline pipeline(std::move(collaborators), std::move(settings));
        auto result = pipeline.process(mediaPath, request);
        // Let the last progress lines reach stderr before the result.
        pipeline.tracker().waitForDelivery();

        Scribe::Logger::instance().flush();
        if (result.hasError()) {
            QTextStream(stderr) << "Error: " << result.error().message << Qt::endl;
            return 1;
        }

        QTextStream out(stdout);
        out << QJsonDocument(result.value().toJson()).toJson(QJsonDocument::Indented);
        out.flush();
        return 0;

    } catch (const std::exception& e) {
        SCRIBE_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
