#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>

#include "ModelCatalog.hpp"
#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace Scribe {

/**
 * @brief Makes catalog models locally available.
 *
 * Self-managed models are left to the engine. Remote models are downloaded
 * into the models folder through a "<file>.part" temporary that is renamed
 * onto the final path only after the full payload arrived.
 *
 * ensureReady() blocks on a local event loop and may be called from worker
 * threads. When a network manager is injected it must live in the thread
 * that calls ensureReady(); otherwise a private manager is created per call.
 *
 * The transfer timeout is an inactivity limit: it restarts on every chunk.
 */
class ModelProvisioner : public QObject {
    Q_OBJECT

public:
    ModelProvisioner(const ModelCatalog& catalog,
                     const ProvisionerSettings& settings,
                     QObject* parent = nullptr);

    // Catalog lookup only, never touches network or disk
    Expected<ModelDescriptor, PipelineError> resolve(const QString& modelId) const;

    /**
     * @brief Acquires the model weights if needed.
     * @param jobId Key for cancel(); downloads without one cannot be aborted
     * @param cancelRequested Checked once the download is registered
     * @return Local weights path, or an empty string for self-managed models
     */
    Expected<QString, PipelineError> ensureReady(const ModelDescriptor& descriptor,
                                                 const ProgressCallback& onProgress = ProgressCallback(),
                                                 const QString& jobId = QString(),
                                                 const CancelCheck& cancelRequested = CancelCheck());

    // Aborts the job's running download; false when none is running
    bool cancel(const QString& jobId);

    bool isInstalled(const ModelDescriptor& descriptor) const;

    // Expected local path; ids outside the catalog map to "<id>.bin"
    QString modelPath(const QString& modelId) const;
    QString modelPath(const ModelDescriptor& descriptor) const;

    // Model files currently present in the models folder
    QStringList listInstalled() const;

    bool isAllowedUrl(const QUrl& url) const;

    const ProvisionerSettings& settings() const { return settings_; }

    void setNetworkAccessManager(QNetworkAccessManager* manager);

signals:
    void downloadStarted(const QString& modelName, const QString& url);
    void downloadCompleted(const QString& modelName, const QString& localPath);
    void downloadFailed(const QString& modelName, const QString& errorMessage);

private:
    Expected<void, PipelineError> download(const ModelDescriptor& descriptor,
                                           const QString& partPath,
                                           const ProgressCallback& onProgress,
                                           const QString& jobId,
                                           const CancelCheck& cancelRequested);

    bool isCancelled(const QString& jobId) const;

    const ModelCatalog& catalog_;
    ProvisionerSettings settings_;
    QNetworkAccessManager* networkManager_ = nullptr;

    mutable QMutex mutex_;
    QHash<QString, QNetworkReply*> replies_;
    QSet<QString> cancelled_;
};

} // namespace Scribe
