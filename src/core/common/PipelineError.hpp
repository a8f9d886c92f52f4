#pragma once

#include <QtCore/QString>
#include <QtCore/QMetaType>

namespace Scribe {

enum class PipelineErrorKind {
    ValidationError,        // Unknown model id, disallowed acquisition URL
    AcquisitionError,       // Network or storage failure while downloading a model
    ProcessLaunchError,     // Engine executable or interpreter could not be spawned
    ProcessExecutionError,  // Engine exited with a non-zero code or crashed
    OutputParseError,       // Engine output is not a well-formed transcript document
    StorageError,           // Transcript artifact could not be written
    Cancelled               // Job aborted while in flight
};

/**
 * @brief Failure reported by any stage of the transcription pipeline.
 *
 * Process failures carry the exit code and the tail of the engine's stderr;
 * parse failures carry the path of the raw output dump when one was written.
 */
struct PipelineError {
    PipelineErrorKind kind = PipelineErrorKind::ValidationError;
    QString message;
    int exitCode = 0;
    QString stderrTail;
    QString diagnosticPath;

    PipelineError() = default;
    PipelineError(PipelineErrorKind errorKind, const QString& errorMessage)
        : kind(errorKind), message(errorMessage) {}

    static PipelineError validation(const QString& message);
    static PipelineError acquisition(const QString& message);
    static PipelineError launch(const QString& message);
    static PipelineError execution(const QString& message, int exitCode, const QString& stderrTail);
    static PipelineError parse(const QString& message, const QString& diagnosticPath = QString());
    static PipelineError storage(const QString& message);
    static PipelineError cancelled(const QString& message = QStringLiteral("Cancelled"));

    // Message surfaced to the job store and the user
    QString userMessage() const;
};

QString toString(PipelineErrorKind kind);

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::PipelineError)
