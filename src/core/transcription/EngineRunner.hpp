#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>

#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

class QProcess;

namespace Scribe {

/**
 * @brief Runs the external speech-recognition engine for one request.
 *
 * run() blocks the calling thread on a local event loop until the process
 * exits and returns the complete, unparsed stdout. At most maxConcurrent()
 * processes run at a time; further callers wait for a free slot.
 *
 * The runner must outlive every run() call in flight.
 */
class EngineRunner : public QObject {
    Q_OBJECT

public:
    explicit EngineRunner(const EngineSettings& settings, QObject* parent = nullptr);
    ~EngineRunner() override;

    /**
     * @brief Engine arguments for a request, without the program prefix.
     *
     * <input> <model> <language or ""> --device d --temperature f
     * --compression_ratio_threshold f --logprob_threshold f
     * --no_speech_threshold f, followed by the flags that differ from the
     * engine defaults.
     */
    static QStringList buildArguments(const TranscriptionRequest& request);

    // Shortest round-trip rendering: 0, 2.4, -1
    static QString formatNumber(double value);

    // Program prefix arguments followed by buildArguments()
    QStringList commandLine(const TranscriptionRequest& request) const;

    /**
     * @brief Runs the engine and returns its stdout.
     *
     * cancelRequested is checked once the job is registered, so a cancel that
     * lands before registration still stops the run before the engine spawns.
     */
    Expected<QByteArray, PipelineError> run(const QString& jobId,
                                            const TranscriptionRequest& request,
                                            const ProgressCallback& onProgress = ProgressCallback(),
                                            const CancelCheck& cancelRequested = CancelCheck());

    // Kills the job's process or abandons its wait for a slot; false when not in flight
    bool cancel(const QString& jobId);
    void cancelAll();

    QStringList activeJobs() const;
    int maxConcurrent() const;
    const EngineSettings& settings() const { return settings_; }

signals:
    void processStarted(const QString& jobId, qint64 processId);
    void processFinished(const QString& jobId, int exitCode);

private:
    bool acquireSlot(const QString& jobId);
    void releaseSlot();
    bool isCancelled(const QString& jobId) const;

    EngineSettings settings_;

    mutable QMutex mutex_;
    QWaitCondition slotAvailable_;
    int freeSlots_;
    QSet<QString> inFlight_;
    QSet<QString> cancelled_;
    QHash<QString, QProcess*> processes_;
};

} // namespace Scribe
