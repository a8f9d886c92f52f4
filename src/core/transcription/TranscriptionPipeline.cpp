#include "TranscriptionPipeline.hpp"
#include "EngineRunner.hpp"
#include "ModelProvisioner.hpp"
#include "TranscriptNormalizer.hpp"
#include "../jobs/JobStateStore.hpp"
#include "../media/AudioDurationProbe.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QScopeGuard>
#include <QtConcurrent>

namespace Scribe {

TranscriptionPipeline::TranscriptionPipeline(JobStateStore& store,
                                             ModelProvisioner& provisioner,
                                             EngineRunner& runner,
                                             AudioDurationProbe* durationProbe,
                                             QObject* parent)
    : QObject(parent)
    , store_(store)
    , provisioner_(provisioner)
    , runner_(runner)
    , durationProbe_(durationProbe) {
    qRegisterMetaType<Scribe::Transcript>("Scribe::Transcript");
    qRegisterMetaType<Scribe::PipelineError>("Scribe::PipelineError");
}

Expected<Transcript, PipelineError> TranscriptionPipeline::process(const TranscriptionJob& job) {
    markActive(job.jobId);
    auto activeGuard = qScopeGuard([this, &job]() { forgetJob(job.jobId); });

    Logger::instance().info("TranscriptionPipeline: Job {} started for {}",
                            job.jobId.toStdString(), job.audioPath.toStdString());
    store_.startJob(job.jobId);

    auto result = runSteps(job);
    if (result.hasError()) {
        store_.failStep(job.jobId, result.error().userMessage());
        return result;
    }

    store_.completeJob(job.jobId);
    emit transcriptReady(job.jobId, artifactPath(job.outputPath));
    return result;
}

QFuture<Expected<Transcript, PipelineError>> TranscriptionPipeline::processAsync(const TranscriptionJob& job) {
    // Cancellable while it waits for a pool thread
    markActive(job.jobId);
    return QtConcurrent::run([this, job]() {
        return process(job);
    });
}

bool TranscriptionPipeline::cancel(const QString& jobId) {
    {
        QMutexLocker locker(&mutex_);
        if (!active_.contains(jobId)) {
            SCRIBE_DEBUG("TranscriptionPipeline: Ignoring cancel for inactive job {}", jobId.toStdString());
            return false;
        }
        cancelled_.insert(jobId);
    }

    // The flag is set first; both components check it when they register the job
    Logger::instance().info("TranscriptionPipeline: Cancel requested for job {}", jobId.toStdString());
    provisioner_.cancel(jobId);
    runner_.cancel(jobId);
    return true;
}

QString TranscriptionPipeline::outputBase(const QString& outputPath) {
    const QFileInfo info(outputPath);
    if (info.suffix().isEmpty()) {
        return outputPath;
    }
    return info.path() + "/" + info.completeBaseName();
}

QString TranscriptionPipeline::artifactPath(const QString& outputPath) {
    return outputBase(outputPath) + ".json";
}

Expected<Transcript, PipelineError> TranscriptionPipeline::runSteps(const TranscriptionJob& job) {
    const QString& jobId = job.jobId;

    const CancelCheck cancelRequested = [this, jobId]() { return isCancelled(jobId); };

    // Acquisition
    store_.setStep(jobId, PipelineStep::Acquisition);

    if (isCancelled(jobId)) {
        return makeUnexpected(PipelineError::cancelled());
    }

    if (!QFileInfo(job.audioPath).isFile()) {
        return makeUnexpected(PipelineError::validation(
            QString("Audio file not found: %1").arg(job.audioPath)));
    }

    auto descriptor = provisioner_.resolve(job.modelId);
    if (descriptor.hasError()) {
        return makeUnexpected(descriptor.error());
    }

    auto localModel = provisioner_.ensureReady(descriptor.value(), [this, &jobId](double fraction) {
        store_.setProgress(jobId, PipelineStep::Acquisition, fraction);
    }, jobId, cancelRequested);
    if (localModel.hasError()) {
        return makeUnexpected(localModel.error());
    }

    qint64 audioDurationMs = -1;
    if (durationProbe_) {
        auto duration = durationProbe_->durationMs(job.audioPath);
        if (duration.hasValue()) {
            audioDurationMs = duration.value();
        } else {
            Logger::instance().warn("TranscriptionPipeline: Could not determine duration of {}: {}",
                                    job.audioPath.toStdString(), duration.error().message.toStdString());
        }
    }

    if (isCancelled(jobId)) {
        return makeUnexpected(PipelineError::cancelled());
    }

    // Transcription
    store_.setStep(jobId, PipelineStep::Transcription);

    TranscriptionRequest request;
    request.audioPath = job.audioPath;
    request.modelId = descriptor.value().isSelfManaged() ? descriptor.value().name : localModel.value();
    request.options = job.options;

    QElapsedTimer timer;
    timer.start();

    auto output = runner_.run(jobId, request, [this, &jobId](double fraction) {
        store_.setProgress(jobId, PipelineStep::Transcription, fraction);
    }, cancelRequested);
    if (output.hasError()) {
        return makeUnexpected(output.error());
    }

    const qint64 elapsedMs = timer.elapsed();
    if (audioDurationMs > 0) {
        Logger::instance().info("TranscriptionPipeline: Job {} transcribed {} ms of audio in {} ms (RTF {:.2f})",
                                jobId.toStdString(), audioDurationMs, elapsedMs,
                                static_cast<double>(elapsedMs) / static_cast<double>(audioDurationMs));
    } else {
        Logger::instance().info("TranscriptionPipeline: Job {} transcribed in {} ms", jobId.toStdString(), elapsedMs);
    }

    auto transcript = TranscriptNormalizer::parse(output.value(), outputBase(job.outputPath));
    if (transcript.hasError()) {
        return makeUnexpected(transcript.error());
    }

    ArtifactContext context;
    context.modelName = descriptor.value().name;
    context.modelPath = localModel.value();     // Empty for self-managed models
    context.multilingual = !descriptor.value().englishOnly;
    context.translate = job.options.translate;

    auto written = TranscriptNormalizer::writeArtifact(artifactPath(job.outputPath), transcript.value(), context);
    if (written.hasError()) {
        return makeUnexpected(written.error());
    }

    Logger::instance().info("TranscriptionPipeline: Job {} produced {} segments ({})",
                            jobId.toStdString(), transcript.value().segments.size(),
                            transcript.value().language.toStdString());
    return transcript.value();
}

bool TranscriptionPipeline::isCancelled(const QString& jobId) const {
    QMutexLocker locker(&mutex_);
    return cancelled_.contains(jobId);
}

void TranscriptionPipeline::markActive(const QString& jobId) {
    QMutexLocker locker(&mutex_);
    active_.insert(jobId);
}

void TranscriptionPipeline::forgetJob(const QString& jobId) {
    QMutexLocker locker(&mutex_);
    active_.remove(jobId);
    cancelled_.remove(jobId);
}

} // namespace Scribe
