#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QSet>
#include <QtCore/QMutex>
#include <QFuture>

#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

namespace Scribe {

class JobStateStore;
class ModelProvisioner;
class EngineRunner;
class AudioDurationProbe;

struct TranscriptionJob {
    QString jobId;
    QString audioPath;
    QString outputPath;     // Extension is replaced: <base>.json, <base>.raw.txt
    QString modelId;
    DecodingOptions options;
};

/**
 * @brief Transcribes one recording: acquisition, engine run, normalization.
 *
 * Every stage reports into the shared JobStateStore. Any failure marks the
 * current step failed with the error's user message and is returned as is.
 */
class TranscriptionPipeline : public QObject {
    Q_OBJECT

public:
    TranscriptionPipeline(JobStateStore& store,
                          ModelProvisioner& provisioner,
                          EngineRunner& runner,
                          AudioDurationProbe* durationProbe = nullptr,
                          QObject* parent = nullptr);

    Expected<Transcript, PipelineError> process(const TranscriptionJob& job);

    // Runs process() on the global thread pool
    QFuture<Expected<Transcript, PipelineError>> processAsync(const TranscriptionJob& job);

    // Stops a queued or running job; false for ids that are not active
    bool cancel(const QString& jobId);

    static QString outputBase(const QString& outputPath);
    static QString artifactPath(const QString& outputPath);

signals:
    void transcriptReady(const QString& jobId, const QString& artifactPath);

private:
    Expected<Transcript, PipelineError> runSteps(const TranscriptionJob& job);
    bool isCancelled(const QString& jobId) const;
    void markActive(const QString& jobId);
    void forgetJob(const QString& jobId);

    JobStateStore& store_;
    ModelProvisioner& provisioner_;
    EngineRunner& runner_;
    AudioDurationProbe* durationProbe_;

    mutable QMutex mutex_;
    QSet<QString> active_;      // Queued or running
    QSet<QString> cancelled_;   // Subset of active_
};

} // namespace Scribe
