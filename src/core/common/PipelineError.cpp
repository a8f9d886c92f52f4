#include "PipelineError.hpp"

namespace Scribe {

PipelineError PipelineError::validation(const QString& message) {
    return PipelineError(PipelineErrorKind::ValidationError, message);
}

PipelineError PipelineError::acquisition(const QString& message) {
    return PipelineError(PipelineErrorKind::AcquisitionError, message);
}

PipelineError PipelineError::launch(const QString& message) {
    return PipelineError(PipelineErrorKind::ProcessLaunchError, message);
}

PipelineError PipelineError::execution(const QString& message, int exitCode, const QString& stderrTail) {
    PipelineError error(PipelineErrorKind::ProcessExecutionError, message);
    error.exitCode = exitCode;
    error.stderrTail = stderrTail;
    return error;
}

PipelineError PipelineError::parse(const QString& message, const QString& diagnosticPath) {
    PipelineError error(PipelineErrorKind::OutputParseError, message);
    error.diagnosticPath = diagnosticPath;
    return error;
}

PipelineError PipelineError::storage(const QString& message) {
    return PipelineError(PipelineErrorKind::StorageError, message);
}

PipelineError PipelineError::cancelled(const QString& message) {
    return PipelineError(PipelineErrorKind::Cancelled, message);
}

QString PipelineError::userMessage() const {
    QString text = QString("%1: %2").arg(toString(kind), message);

    if (kind == PipelineErrorKind::ProcessExecutionError) {
        text += QString(" (exit code %1)").arg(exitCode);
        if (!stderrTail.isEmpty()) {
            text += "\n" + stderrTail;
        }
    }

    if (!diagnosticPath.isEmpty()) {
        text += QString(" [raw output saved to %1]").arg(diagnosticPath);
    }

    return text;
}

QString toString(PipelineErrorKind kind) {
    switch (kind) {
        case PipelineErrorKind::ValidationError:
            return QStringLiteral("ValidationError");
        case PipelineErrorKind::AcquisitionError:
            return QStringLiteral("AcquisitionError");
        case PipelineErrorKind::ProcessLaunchError:
            return QStringLiteral("ProcessLaunchError");
        case PipelineErrorKind::ProcessExecutionError:
            return QStringLiteral("ProcessExecutionError");
        case PipelineErrorKind::OutputParseError:
            return QStringLiteral("OutputParseError");
        case PipelineErrorKind::StorageError:
            return QStringLiteral("StorageError");
        case PipelineErrorKind::Cancelled:
            return QStringLiteral("Cancelled");
    }
    return QStringLiteral("UnknownError");
}

} // namespace Scribe
