#include "EngineRunner.hpp"
#include "ProcessOutputSink.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QLocale>
#include <QtCore/QMutexLocker>
#include <QtCore/QProcess>
#include <QtCore/QProcessEnvironment>
#include <QtCore/QRegularExpression>
#include <QtCore/QScopeGuard>

namespace Scribe {

namespace {

constexpr int PROCESS_START_TIMEOUT_MS = 30000;

} // namespace

EngineRunner::EngineRunner(const EngineSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , freeSlots_(qMax(1, settings.maxConcurrent)) {
    settings_.maxConcurrent = freeSlots_;
    Logger::instance().info("EngineRunner initialized: program={}, maxConcurrent={}",
                            settings_.program.toStdString(), settings_.maxConcurrent);
}

EngineRunner::~EngineRunner() {
    cancelAll();
}

QStringList EngineRunner::buildArguments(const TranscriptionRequest& request) {
    const DecodingOptions& options = request.options;

    QString language = options.language.trimmed();
    if (language.compare("auto", Qt::CaseInsensitive) == 0) {
        language.clear();
    }

    QStringList args;
    args << request.audioPath << request.modelId << language;
    args << "--device" << options.device;
    args << "--temperature" << formatNumber(options.temperature);
    args << "--compression_ratio_threshold" << formatNumber(options.compressionRatioThreshold);
    args << "--logprob_threshold" << formatNumber(options.logprobThreshold);
    args << "--no_speech_threshold" << formatNumber(options.noSpeechThreshold);

    if (!options.fp16) {
        args << "--no-fp16";
    }
    if (options.translate) {
        args << "--translate";
    }
    if (!options.conditionOnPreviousText) {
        args << "--no-condition-on-previous-text";
    }
    if (options.wordTimestamps) {
        args << "--word-timestamps";
    }
    if (!options.initialPrompt.isEmpty()) {
        args << "--initial-prompt" << options.initialPrompt;
    }
    return args;
}

QString EngineRunner::formatNumber(double value) {
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

QStringList EngineRunner::commandLine(const TranscriptionRequest& request) const {
    return settings_.programArguments + buildArguments(request);
}

Expected<QByteArray, PipelineError> EngineRunner::run(const QString& jobId,
                                                      const TranscriptionRequest& request,
                                                      const ProgressCallback& onProgress,
                                                      const CancelCheck& cancelRequested) {
    {
        QMutexLocker locker(&mutex_);
        if (inFlight_.contains(jobId)) {
            return makeUnexpected(PipelineError::validation(
                QString("Job %1 already has an engine process").arg(jobId)));
        }
        inFlight_.insert(jobId);
    }
    auto inFlightGuard = qScopeGuard([this, &jobId]() {
        QMutexLocker locker(&mutex_);
        inFlight_.remove(jobId);
        cancelled_.remove(jobId);
    });

    if (cancelRequested && cancelRequested()) {
        Logger::instance().info("EngineRunner: Job {} cancelled before start", jobId.toStdString());
        return makeUnexpected(PipelineError::cancelled());
    }

    if (!acquireSlot(jobId)) {
        Logger::instance().info("EngineRunner: Job {} cancelled while waiting for a slot", jobId.toStdString());
        return makeUnexpected(PipelineError::cancelled());
    }
    auto slotGuard = qScopeGuard([this]() { releaseSlot(); });

    static const QRegularExpression percentRegex(QStringLiteral("(\\d+)%"));

    ProcessOutputSink sink(settings_.stderrTailLines, [&](const QString& line) {
        Logger::instance().info("Engine: {}", line.toStdString());

        const QRegularExpressionMatch match = percentRegex.match(line);
        if (match.hasMatch() && onProgress) {
            bool ok = false;
            const double percent = match.captured(1).toDouble(&ok);
            if (ok) {
                onProgress(percent / 100.0);
            }
        }
    });

    QProcess process;
    process.setProgram(settings_.program);
    process.setArguments(commandLine(request));
    process.setProcessChannelMode(QProcess::SeparateChannels);

    if (!settings_.resourcesPath.isEmpty()) {
        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        const QString path = env.value("PATH");
        env.insert("PATH", path.isEmpty()
            ? settings_.resourcesPath
            : settings_.resourcesPath + QDir::listSeparator() + path);
        process.setProcessEnvironment(env);
        process.setWorkingDirectory(settings_.resourcesPath);
    }

    QEventLoop loop;
    bool done = false;

    connect(&process, &QProcess::readyReadStandardOutput, &loop, [&]() {
        sink.appendStdout(process.readAllStandardOutput());
    });
    connect(&process, &QProcess::readyReadStandardError, &loop, [&]() {
        sink.appendStderr(process.readAllStandardError());
    });
    connect(&process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            &loop, [&](int, QProcess::ExitStatus) {
        done = true;
        loop.quit();
    });

    {
        QMutexLocker locker(&mutex_);
        if (cancelled_.contains(jobId)) {
            return makeUnexpected(PipelineError::cancelled());
        }
        processes_.insert(jobId, &process);
    }
    auto processGuard = qScopeGuard([this, &jobId]() {
        QMutexLocker locker(&mutex_);
        processes_.remove(jobId);
    });

    Logger::instance().info("EngineRunner: Starting {} {}",
                            settings_.program.toStdString(),
                            process.arguments().join(' ').toStdString());
    process.start();

    if (!process.waitForStarted(PROCESS_START_TIMEOUT_MS)) {
        Logger::instance().error("EngineRunner: Failed to start {}: {}",
                                 settings_.program.toStdString(), process.errorString().toStdString());
        return makeUnexpected(PipelineError::launch(
            QString("Failed to start engine \"%1\": %2").arg(settings_.program, process.errorString())));
    }
    emit processStarted(jobId, process.processId());

    if (!done && process.state() != QProcess::NotRunning) {
        loop.exec();
    }

    sink.appendStdout(process.readAllStandardOutput());
    sink.appendStderr(process.readAllStandardError());
    sink.finish();

    const int exitCode = process.exitCode();
    const QProcess::ExitStatus exitStatus = process.exitStatus();
    emit processFinished(jobId, exitCode);

    if (isCancelled(jobId)) {
        sink.discardStdout();
        Logger::instance().info("EngineRunner: Job {} cancelled", jobId.toStdString());
        return makeUnexpected(PipelineError::cancelled());
    }

    const QString tail = sink.stderrTail().join('\n');
    if (exitStatus == QProcess::CrashExit) {
        Logger::instance().error("EngineRunner: Engine crashed for job {}", jobId.toStdString());
        return makeUnexpected(PipelineError::execution(
            QString("Engine crashed: %1").arg(process.errorString()), exitCode, tail));
    }
    if (exitCode != 0) {
        Logger::instance().error("EngineRunner: Engine exited with code {} for job {}", exitCode, jobId.toStdString());
        return makeUnexpected(PipelineError::execution(
            QString("Engine exited with code %1").arg(exitCode), exitCode, tail));
    }

    SCRIBE_DEBUG("EngineRunner: Job {} produced {} bytes of output",
                 jobId.toStdString(), sink.stdoutBuffer().size());
    return sink.takeStdout();
}

bool EngineRunner::cancel(const QString& jobId) {
    QMutexLocker locker(&mutex_);
    if (!inFlight_.contains(jobId)) {
        return false;
    }

    cancelled_.insert(jobId);
    slotAvailable_.wakeAll();

    QProcess* process = processes_.value(jobId, nullptr);
    if (process) {
        // The process lives in the thread blocked in run(); kill it there
        QMetaObject::invokeMethod(process, [process]() { process->kill(); }, Qt::QueuedConnection);
    }

    Logger::instance().info("EngineRunner: Cancelling job {}", jobId.toStdString());
    return true;
}

void EngineRunner::cancelAll() {
    const QStringList jobs = activeJobs();
    for (const QString& jobId : jobs) {
        cancel(jobId);
    }
}

QStringList EngineRunner::activeJobs() const {
    QMutexLocker locker(&mutex_);
    return QStringList(inFlight_.cbegin(), inFlight_.cend());
}

int EngineRunner::maxConcurrent() const {
    return settings_.maxConcurrent;
}

bool EngineRunner::acquireSlot(const QString& jobId) {
    QMutexLocker locker(&mutex_);
    while (freeSlots_ == 0 && !cancelled_.contains(jobId)) {
        slotAvailable_.wait(&mutex_);
    }
    if (cancelled_.contains(jobId)) {
        return false;
    }
    --freeSlots_;
    return true;
}

void EngineRunner::releaseSlot() {
    QMutexLocker locker(&mutex_);
    ++freeSlots_;
    slotAvailable_.wakeAll();
}

bool EngineRunner::isCancelled(const QString& jobId) const {
    QMutexLocker locker(&mutex_);
    return cancelled_.contains(jobId);
}

} // namespace Scribe
