#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>
#include <QtCore/QFileInfo>
#include <QtCore/QTextStream>
#include <QtCore/QUuid>

#include <exception>

#include "core/common/Logger.hpp"
#include "core/common/Config.hpp"
#include "core/jobs/JobStateStore.hpp"
#include "core/media/AudioDurationProbe.hpp"
#include "core/transcription/EngineRunner.hpp"
#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelProvisioner.hpp"
#include "core/transcription/TranscriptionPipeline.hpp"

namespace {

void printModels(const Scribe::ModelCatalog& catalog, const Scribe::ModelProvisioner& provisioner) {
    QTextStream out(stdout);
    for (const auto& model : catalog.models()) {
        const QString source = model.isSelfManaged() ? "engine" : "download";
        const QString installed = (!model.isSelfManaged() && provisioner.isInstalled(model)) ? " [installed]" : "";
        out << QString("%1 %2 %3%4%5")
                   .arg(model.name, -20)
                   .arg(model.approximateSize, -8)
                   .arg(source, -9)
                   .arg(model.englishOnly ? " english-only" : "")
                   .arg(installed)
            << Qt::endl;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ScribeTranscriber");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Scribe");

    QCommandLineParser parser;
    parser.setApplicationDescription("Transcribes an audio recording with an external speech recognition engine.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("audio", "Audio file to transcribe.");

    const QCommandLineOption outputOption({"o", "output"}, "Transcript path (extension is replaced by .json).", "path");
    const QCommandLineOption modelOption({"m", "model"}, "Model from the catalog.", "name");
    const QCommandLineOption languageOption({"l", "language"}, "Language code or auto.", "code");
    const QCommandLineOption deviceOption("device", "auto, cuda or cpu.", "device");
    const QCommandLineOption temperatureOption("temperature", "Sampling temperature.", "value");
    const QCommandLineOption translateOption("translate", "Translate to English.");
    const QCommandLineOption wordTimestampsOption("word-timestamps", "Word-level timestamps.");
    const QCommandLineOption noFp16Option("no-fp16", "Disable FP16 inference.");
    const QCommandLineOption noConditionOption("no-condition-on-previous-text",
                                               "Do not feed previous text to the next window.");
    const QCommandLineOption promptOption("initial-prompt", "Prompt for the first window.", "text");
    const QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    const QCommandLineOption listModelsOption("list-models", "List the model catalog and exit.");
    const QCommandLineOption verboseOption({"v", "verbose"}, "Debug logging.");

    parser.addOptions({outputOption, modelOption, languageOption, deviceOption, temperatureOption,
                       translateOption, wordTimestampsOption, noFp16Option, noConditionOption,
                       promptOption, configOption, listModelsOption, verboseOption});
    parser.process(app);

    try {
        auto& config = Scribe::Config::instance();
        if (parser.isSet(configOption)) {
            config.initializeFromFile(parser.value(configOption));
        } else {
            config.initialize();
        }

        Scribe::Logger::instance().initialize(
            config.getLogFilePath().toStdString(),
            parser.isSet(verboseOption) ? Scribe::Logger::Level::Debug : Scribe::Logger::Level::Info);
        Scribe::Logger::instance().info("Starting Scribe Transcriber v{}", app.applicationVersion().toStdString());

        const Scribe::ModelCatalog& catalog = Scribe::ModelCatalog::builtin();
        Scribe::ModelProvisioner provisioner(catalog, config.getProvisionerSettings());

        if (parser.isSet(listModelsOption)) {
            printModels(catalog, provisioner);
            return 0;
        }

        const QStringList positional = parser.positionalArguments();
        if (positional.size() != 1) {
            parser.showHelp(1);
        }

        Scribe::DecodingOptions options = config.getDecodingOptions();
        if (parser.isSet(languageOption)) {
            options.language = parser.value(languageOption);
        }
        if (parser.isSet(deviceOption)) {
            options.device = parser.value(deviceOption);
        }
        if (parser.isSet(temperatureOption)) {
            bool ok = false;
            options.temperature = parser.value(temperatureOption).toDouble(&ok);
            if (!ok) {
                Scribe::Logger::instance().error("Invalid temperature: {}", parser.value(temperatureOption).toStdString());
                return 1;
            }
        }
        if (parser.isSet(translateOption)) {
            options.translate = true;
        }
        if (parser.isSet(wordTimestampsOption)) {
            options.wordTimestamps = true;
        }
        if (parser.isSet(noFp16Option)) {
            options.fp16 = false;
        }
        if (parser.isSet(noConditionOption)) {
            options.conditionOnPreviousText = false;
        }
        if (parser.isSet(promptOption)) {
            options.initialPrompt = parser.value(promptOption);
        }

        const QString audioPath = QFileInfo(positional.first()).absoluteFilePath();

        Scribe::TranscriptionJob job;
        job.jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        job.audioPath = audioPath;
        job.outputPath = parser.isSet(outputOption) ? parser.value(outputOption) : audioPath;
        job.modelId = parser.isSet(modelOption) ? parser.value(modelOption) : config.getDefaultModel();
        job.options = options;

        Scribe::JobStateStore store;
        Scribe::EngineRunner runner(config.getEngineSettings());
        Scribe::FfprobeDurationProbe durationProbe;
        Scribe::TranscriptionPipeline pipeline(store, provisioner, runner, &durationProbe);

        QTextStream err(stderr);
        QObject::connect(&store, &Scribe::JobStateStore::progressChanged,
                         [&err](const QString&, Scribe::PipelineStep step, double progress) {
            err << QString("[%1] %2%").arg(Scribe::stepName(step)).arg(qRound(progress * 100)) << Qt::endl;
        });

        auto result = pipeline.process(job);
        if (result.hasError()) {
            err << "Transcription failed: " << result.error().userMessage() << Qt::endl;
            return 1;
        }

        QTextStream(stdout) << Scribe::TranscriptionPipeline::artifactPath(job.outputPath) << Qt::endl;
        return 0;

    } catch (const std::exception& e) {
        Scribe::Logger::instance().critical("Fatal error: {}", e.what());
        return 1;
    }
}
