#include "AudioDurationProbe.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QProcess>

namespace Scribe {

FfprobeDurationProbe::FfprobeDurationProbe(const QString& ffprobePath, int timeoutMs)
    : ffprobePath_(ffprobePath)
    , timeoutMs_(timeoutMs) {
}

Expected<qint64, PipelineError> FfprobeDurationProbe::durationMs(const QString& audioPath) {
    if (!QFileInfo::exists(audioPath)) {
        return makeUnexpected(PipelineError::validation(
            QString("Audio file not found: %1").arg(audioPath)));
    }

    QProcess ffprobeProcess;
    QStringList args;

    args << "-v" << "quiet";
    args << "-print_format" << "json";
    args << "-show_format";
    args << audioPath;

    ffprobeProcess.start(ffprobePath_, args);

    if (!ffprobeProcess.waitForStarted()) {
        return makeUnexpected(PipelineError::launch(
            QString("Failed to start %1: %2").arg(ffprobePath_, ffprobeProcess.errorString())));
    }

    if (!ffprobeProcess.waitForFinished(timeoutMs_)) {
        ffprobeProcess.kill();
        ffprobeProcess.waitForFinished();
        return makeUnexpected(PipelineError::execution(
            QString("%1 timed out").arg(ffprobePath_), -1, QString()));
    }

    if (ffprobeProcess.exitStatus() != QProcess::NormalExit || ffprobeProcess.exitCode() != 0) {
        return makeUnexpected(PipelineError::execution(
            QString("%1 failed").arg(ffprobePath_), ffprobeProcess.exitCode(),
            QString::fromUtf8(ffprobeProcess.readAllStandardError())));
    }

    const QByteArray output = ffprobeProcess.readAllStandardOutput();
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(output, &error);

    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return makeUnexpected(PipelineError::parse(
            QString("Unreadable %1 report: %2").arg(ffprobePath_, error.errorString())));
    }

    const QJsonObject format = doc.object()["format"].toObject();
    bool ok = false;
    const double duration = format["duration"].toString().toDouble(&ok);
    if (!ok || duration < 0.0) {
        return makeUnexpected(PipelineError::parse(
            QString("No duration reported for %1").arg(audioPath)));
    }

    SCRIBE_DEBUG("FfprobeDurationProbe: {} lasts {:.3f} s", audioPath.toStdString(), duration);
    return static_cast<qint64>(duration * 1000);  // Convert to milliseconds
}

} // namespace Scribe
