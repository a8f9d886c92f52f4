#pragma once

#include <QtCore/QString>
#include <QtCore/QList>
#include <QtCore/QMetaType>
#include "../common/Expected.hpp"

namespace Scribe {

enum class PipelineStep {
    Acquisition,
    Wav,
    Mp3,
    Transcription,
    Summary,
    Export
};

enum class StepStatus {
    Pending,
    Running,
    Succeeded,
    Failed
};

enum class StoreError {
    UnknownJob,
    UnknownStep
};

struct StepState {
    PipelineStep step = PipelineStep::Acquisition;
    double progress = 0.0;
    StepStatus status = StepStatus::Pending;
    QString message;
};

struct JobState {
    QString jobId;
    QList<StepState> steps;     // In the order they were entered
    int currentIndex = -1;
    bool isRunning = false;
    bool isDone = false;
    QString error;

    bool hasCurrentStep() const {
        return currentIndex >= 0 && currentIndex < steps.size();
    }

    // Only valid when hasCurrentStep()
    const StepState& currentStep() const {
        return steps.at(currentIndex);
    }

    int indexOf(PipelineStep step) const {
        for (int i = 0; i < steps.size(); ++i) {
            if (steps.at(i).step == step) {
                return i;
            }
        }
        return -1;
    }
};

QString stepName(PipelineStep step);
Expected<PipelineStep, StoreError> stepFromName(const QString& name);
QString statusName(StepStatus status);

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::PipelineStep)
Q_DECLARE_METATYPE(Scribe::JobState)
