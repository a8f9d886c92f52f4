#pragma once

#include <QtCore/QObject>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QStringList>

#include "JobTypes.hpp"
#include "../common/Expected.hpp"

namespace Scribe {

/**
 * @brief Job-keyed record of pipeline steps and the current step's progress.
 *
 * One instance is shared by every component working on a job and by whoever
 * presents progress. Writes are serialized; signals are emitted after the
 * internal lock is released, from the writer's thread.
 *
 * Progress reported for a step that is not the job's current step is ignored,
 * so a superseded step can never overwrite the progress of its successor.
 */
class JobStateStore : public QObject {
    Q_OBJECT

public:
    explicit JobStateStore(QObject* parent = nullptr);

    // Registers the job (or resets a finished one) and marks it running
    void startJob(const QString& jobId);

    /**
     * @brief Makes step the current step with progress 0.
     *
     * The previous current step, if still running, is marked succeeded since
     * steps only advance once their predecessor finished. Unknown jobs are
     * created implicitly.
     */
    void setStep(const QString& jobId, PipelineStep step);

    /**
     * @brief Sets the current step's progress, clamped to [0,1].
     * @return false when the job is unknown or step is not current (ignored)
     */
    bool setProgress(const QString& jobId, PipelineStep step, double fraction);

    // Marks the current step failed and stops the job
    void failStep(const QString& jobId, const QString& message);

    // Marks the current step succeeded and the job done
    void completeJob(const QString& jobId);

    bool removeJob(const QString& jobId);

    Expected<JobState, StoreError> getState(const QString& jobId) const;
    QStringList jobIds() const;

signals:
    void jobStarted(const QString& jobId);
    void stepChanged(const QString& jobId, Scribe::PipelineStep step);
    void progressChanged(const QString& jobId, Scribe::PipelineStep step, double progress);
    void jobFailed(const QString& jobId, Scribe::PipelineStep step, const QString& message);
    void jobCompleted(const QString& jobId);
    void jobRemoved(const QString& jobId);

private:
    mutable QMutex mutex_;
    QHash<QString, JobState> jobs_;
};

} // namespace Scribe
