#include "JobStateStore.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QMutexLocker>
#include <algorithm>
#include <cmath>

namespace Scribe {

QString stepName(PipelineStep step) {
    switch (step) {
        case PipelineStep::Acquisition:
            return QStringLiteral("acquisition");
        case PipelineStep::Wav:
            return QStringLiteral("wav");
        case PipelineStep::Mp3:
            return QStringLiteral("mp3");
        case PipelineStep::Transcription:
            return QStringLiteral("transcription");
        case PipelineStep::Summary:
            return QStringLiteral("summary");
        case PipelineStep::Export:
            return QStringLiteral("export");
    }
    return QString();
}

Expected<PipelineStep, StoreError> stepFromName(const QString& name) {
    static const PipelineStep allSteps[] = {
        PipelineStep::Acquisition, PipelineStep::Wav, PipelineStep::Mp3,
        PipelineStep::Transcription, PipelineStep::Summary, PipelineStep::Export
    };

    const QString normalized = name.trimmed().toLower();
    for (PipelineStep step : allSteps) {
        if (stepName(step) == normalized) {
            return step;
        }
    }
    return makeUnexpected(StoreError::UnknownStep);
}

QString statusName(StepStatus status) {
    switch (status) {
        case StepStatus::Pending:
            return QStringLiteral("pending");
        case StepStatus::Running:
            return QStringLiteral("running");
        case StepStatus::Succeeded:
            return QStringLiteral("succeeded");
        case StepStatus::Failed:
            return QStringLiteral("failed");
    }
    return QString();
}

JobStateStore::JobStateStore(QObject* parent)
    : QObject(parent) {
    qRegisterMetaType<Scribe::PipelineStep>("Scribe::PipelineStep");
    qRegisterMetaType<Scribe::JobState>("Scribe::JobState");
}

void JobStateStore::startJob(const QString& jobId) {
    {
        QMutexLocker locker(&mutex_);
        JobState state;
        state.jobId = jobId;
        state.isRunning = true;
        jobs_.insert(jobId, state);
    }

    SCRIBE_DEBUG("JobStateStore: job {} started", jobId.toStdString());
    emit jobStarted(jobId);
}

void JobStateStore::setStep(const QString& jobId, PipelineStep step) {
    {
        QMutexLocker locker(&mutex_);

        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            JobState state;
            state.jobId = jobId;
            state.isRunning = true;
            it = jobs_.insert(jobId, state);
        }

        JobState& state = it.value();
        if (state.hasCurrentStep()) {
            StepState& previous = state.steps[state.currentIndex];
            if (previous.status == StepStatus::Running) {
                previous.status = StepStatus::Succeeded;
            }
        }

        int index = state.indexOf(step);
        if (index < 0) {
            StepState entry;
            entry.step = step;
            state.steps.append(entry);
            index = state.steps.size() - 1;
        }

        StepState& current = state.steps[index];
        current.progress = 0.0;
        current.status = StepStatus::Running;
        current.message.clear();
        state.currentIndex = index;
        state.isRunning = true;
        state.isDone = false;
    }

    SCRIBE_DEBUG("JobStateStore: job {} entered step {}", jobId.toStdString(), stepName(step).toStdString());
    emit stepChanged(jobId, step);
    emit progressChanged(jobId, step, 0.0);
}

bool JobStateStore::setProgress(const QString& jobId, PipelineStep step, double fraction) {
    if (!std::isfinite(fraction)) {
        SCRIBE_DEBUG("JobStateStore: ignoring non-finite progress for job {}", jobId.toStdString());
        return false;
    }
    const double clamped = std::clamp(fraction, 0.0, 1.0);

    {
        QMutexLocker locker(&mutex_);

        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            SCRIBE_DEBUG("JobStateStore: ignoring progress for unknown job {}", jobId.toStdString());
            return false;
        }

        JobState& state = it.value();
        if (!state.hasCurrentStep() || state.currentStep().step != step) {
            SCRIBE_DEBUG("JobStateStore: ignoring stale progress for step {} of job {}",
                         stepName(step).toStdString(), jobId.toStdString());
            return false;
        }

        state.steps[state.currentIndex].progress = clamped;
    }

    emit progressChanged(jobId, step, clamped);
    return true;
}

void JobStateStore::failStep(const QString& jobId, const QString& message) {
    PipelineStep failedStep = PipelineStep::Acquisition;

    {
        QMutexLocker locker(&mutex_);

        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            SCRIBE_WARN("JobStateStore: failure reported for unknown job {}: {}",
                        jobId.toStdString(), message.toStdString());
            return;
        }

        JobState& state = it.value();
        if (state.hasCurrentStep()) {
            StepState& current = state.steps[state.currentIndex];
            current.status = StepStatus::Failed;
            current.message = message;
            failedStep = current.step;
        }
        state.isRunning = false;
        state.isDone = false;
        state.error = message;
    }

    SCRIBE_ERROR("JobStateStore: job {} failed in step {}: {}",
                 jobId.toStdString(), stepName(failedStep).toStdString(), message.toStdString());
    emit jobFailed(jobId, failedStep, message);
}

void JobStateStore::completeJob(const QString& jobId) {
    {
        QMutexLocker locker(&mutex_);

        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            return;
        }

        JobState& state = it.value();
        if (state.hasCurrentStep()) {
            StepState& current = state.steps[state.currentIndex];
            if (current.status == StepStatus::Running) {
                current.status = StepStatus::Succeeded;
                current.progress = 1.0;
            }
        }
        state.isRunning = false;
        state.isDone = true;
    }

    SCRIBE_INFO("JobStateStore: job {} completed", jobId.toStdString());
    emit jobCompleted(jobId);
}

bool JobStateStore::removeJob(const QString& jobId) {
    {
        QMutexLocker locker(&mutex_);
        if (jobs_.remove(jobId) == 0) {
            return false;
        }
    }

    emit jobRemoved(jobId);
    return true;
}

Expected<JobState, StoreError> JobStateStore::getState(const QString& jobId) const {
    QMutexLocker locker(&mutex_);

    auto it = jobs_.constFind(jobId);
    if (it == jobs_.constEnd()) {
        return makeUnexpected(StoreError::UnknownJob);
    }
    return it.value();
}

QStringList JobStateStore::jobIds() const {
    QMutexLocker locker(&mutex_);
    return jobs_.keys();
}

} // namespace Scribe
