#include "ModelProvisioner.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QScopeGuard>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <algorithm>
#include <memory>

namespace Scribe {

namespace {

void reportProgress(const ProgressCallback& onProgress, double fraction) {
    if (onProgress) {
        onProgress(std::clamp(fraction, 0.0, 1.0));
    }
}

void removePartialFile(const QString& partPath) {
    if (QFile::exists(partPath) && !QFile::remove(partPath)) {
        Logger::instance().warn("ModelProvisioner: Failed to remove partial file: {}", partPath.toStdString());
    }
}

} // namespace

ModelProvisioner::ModelProvisioner(const ModelCatalog& catalog,
                                   const ProvisionerSettings& settings,
                                   QObject* parent)
    : QObject(parent)
    , catalog_(catalog)
    , settings_(settings) {
}

Expected<ModelDescriptor, PipelineError> ModelProvisioner::resolve(const QString& modelId) const {
    return catalog_.find(modelId);
}

Expected<QString, PipelineError> ModelProvisioner::ensureReady(const ModelDescriptor& descriptor,
                                                               const ProgressCallback& onProgress,
                                                               const QString& jobId,
                                                               const CancelCheck& cancelRequested) {
    if (descriptor.isSelfManaged()) {
        SCRIBE_DEBUG("ModelProvisioner: {} is managed by the engine", descriptor.name.toStdString());
        reportProgress(onProgress, 1.0);
        return QString();
    }

    const QUrl url(descriptor.url);
    if (!isAllowedUrl(url)) {
        SCRIBE_ERROR("ModelProvisioner: Refusing download of {} from {}",
                     descriptor.name.toStdString(), descriptor.url.toStdString());
        return makeUnexpected(PipelineError::validation(
            QString("Download URL for model \"%1\" is not under %2")
                .arg(descriptor.name, settings_.allowedUrlPrefix)));
    }

    const QString localPath = modelPath(descriptor);
    if (isInstalled(descriptor)) {
        SCRIBE_INFO("ModelProvisioner: {} already present at {}",
                    descriptor.name.toStdString(), localPath.toStdString());
        reportProgress(onProgress, 1.0);
        return localPath;
    }

    QDir modelsDir(settings_.modelsPath);
    if (!modelsDir.exists() && !modelsDir.mkpath(".")) {
        return makeUnexpected(PipelineError::acquisition(
            QString("Cannot create models folder %1").arg(settings_.modelsPath)));
    }

    const QString partPath = localPath + ".part";
    removePartialFile(partPath);

    Logger::instance().info("ModelProvisioner: Downloading {} ({}) from {}",
                            descriptor.name.toStdString(),
                            descriptor.approximateSize.toStdString(),
                            descriptor.url.toStdString());
    emit downloadStarted(descriptor.name, descriptor.url);

    auto result = download(descriptor, partPath, onProgress, jobId, cancelRequested);
    if (result.hasError()) {
        removePartialFile(partPath);
        emit downloadFailed(descriptor.name, result.error().message);
        return makeUnexpected(result.error());
    }

    if (QFile::exists(localPath) && !QFile::remove(localPath)) {
        removePartialFile(partPath);
        return makeUnexpected(PipelineError::acquisition(
            QString("Cannot replace existing model file %1").arg(localPath)));
    }
    if (!QFile::rename(partPath, localPath)) {
        removePartialFile(partPath);
        return makeUnexpected(PipelineError::acquisition(
            QString("Cannot move downloaded model into place at %1").arg(localPath)));
    }

    reportProgress(onProgress, 1.0);
    Logger::instance().info("ModelProvisioner: {} ready at {}",
                            descriptor.name.toStdString(), localPath.toStdString());
    emit downloadCompleted(descriptor.name, localPath);
    return localPath;
}

Expected<void, PipelineError> ModelProvisioner::download(const ModelDescriptor& descriptor,
                                                         const QString& partPath,
                                                         const ProgressCallback& onProgress,
                                                         const QString& jobId,
                                                         const CancelCheck& cancelRequested) {
    std::unique_ptr<QNetworkAccessManager> localManager;
    QNetworkAccessManager* manager = networkManager_;
    if (!manager) {
        localManager = std::make_unique<QNetworkAccessManager>();
        manager = localManager.get();
    }

    QUrl url(descriptor.url);
    for (int hop = 0; hop <= settings_.maxRedirects; ++hop) {
        if (!isAllowedUrl(url)) {
            return makeUnexpected(PipelineError::acquisition(
                QString("Redirected outside of %1: %2").arg(settings_.allowedUrlPrefix, url.toString())));
        }

        QFile file(partPath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return makeUnexpected(PipelineError::acquisition(
                QString("Cannot open %1 for writing: %2").arg(partPath, file.errorString())));
        }

        QNetworkRequest request(url);
        request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
        request.setHeader(QNetworkRequest::UserAgentHeader, settings_.userAgent);

        std::unique_ptr<QNetworkReply> reply(manager->get(request));
        if (!reply) {
            return makeUnexpected(PipelineError::acquisition(
                QString("Failed to create network request for %1").arg(url.toString())));
        }

        if (!jobId.isEmpty()) {
            QMutexLocker locker(&mutex_);
            replies_.insert(jobId, reply.get());
        }
        auto registrationGuard = qScopeGuard([this, &jobId]() {
            if (!jobId.isEmpty()) {
                QMutexLocker locker(&mutex_);
                replies_.remove(jobId);
                cancelled_.remove(jobId);
            }
        });

        if (cancelRequested && cancelRequested()) {
            reply->abort();
            Logger::instance().info("ModelProvisioner: Download of {} cancelled before transfer",
                                    descriptor.name.toStdString());
            return makeUnexpected(PipelineError::cancelled());
        }

        qint64 received = 0;
        bool writeFailed = false;
        bool timedOut = false;

        QTimer timeoutTimer;
        timeoutTimer.setSingleShot(true);

        auto drain = [&]() {
            const QByteArray chunk = reply->readAll();
            if (chunk.isEmpty() || writeFailed) {
                return;
            }
            // Redirect bodies are not part of the payload
            if (reply->attribute(QNetworkRequest::RedirectionTargetAttribute).isValid()) {
                return;
            }
            if (file.write(chunk) != chunk.size()) {
                writeFailed = true;
                reply->abort();
                return;
            }
            received += chunk.size();
            if (timeoutTimer.isActive()) {
                timeoutTimer.start();
            }

            const qint64 total = reply->header(QNetworkRequest::ContentLengthHeader).toLongLong();
            if (total > 0) {
                reportProgress(onProgress, static_cast<double>(received) / static_cast<double>(total));
            }
        };

        QEventLoop loop;
        connect(&timeoutTimer, &QTimer::timeout, reply.get(), [&]() {
            timedOut = true;
            reply->abort();
        });
        connect(reply.get(), &QNetworkReply::readyRead, &loop, drain);
        connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

        if (!reply->isFinished()) {
            timeoutTimer.start(settings_.timeoutSeconds * 1000);
            loop.exec();
            timeoutTimer.stop();
        }
        drain();
        file.close();

        if (isCancelled(jobId)) {
            Logger::instance().info("ModelProvisioner: Download of {} cancelled", descriptor.name.toStdString());
            return makeUnexpected(PipelineError::cancelled());
        }
        if (timedOut) {
            Logger::instance().error("Network timeout for URL: {}", url.toString().toStdString());
            return makeUnexpected(PipelineError::acquisition(
                QString("Download of %1 stalled: no data for %2 s").arg(descriptor.name).arg(settings_.timeoutSeconds)));
        }
        if (writeFailed) {
            return makeUnexpected(PipelineError::acquisition(
                QString("Failed to write %1: %2").arg(partPath, file.errorString())));
        }
        if (reply->error() != QNetworkReply::NoError) {
            Logger::instance().error("Network error for URL {}: {}",
                                     url.toString().toStdString(), reply->errorString().toStdString());
            return makeUnexpected(PipelineError::acquisition(
                QString("Download of %1 failed: %2").arg(descriptor.name, reply->errorString())));
        }

        const QVariant redirectionTarget = reply->attribute(QNetworkRequest::RedirectionTargetAttribute);
        if (redirectionTarget.isValid()) {
            url = reply->url().resolved(redirectionTarget.toUrl());
            Logger::instance().info("ModelProvisioner: Redirecting download to: {}", url.toString().toStdString());
            continue;
        }

        const QVariant contentLength = reply->header(QNetworkRequest::ContentLengthHeader);
        if (contentLength.isValid() && contentLength.toLongLong() != received) {
            return makeUnexpected(PipelineError::acquisition(
                QString("Download of %1 incomplete: received %2 of %3 bytes")
                    .arg(descriptor.name).arg(received).arg(contentLength.toLongLong())));
        }

        SCRIBE_DEBUG("ModelProvisioner: Received {} bytes for {}", received, descriptor.name.toStdString());
        return {};
    }

    return makeUnexpected(PipelineError::acquisition(
        QString("Too many redirects while downloading %1").arg(descriptor.name)));
}

bool ModelProvisioner::cancel(const QString& jobId) {
    QMutexLocker locker(&mutex_);
    QNetworkReply* reply = replies_.value(jobId, nullptr);
    if (!reply) {
        return false;
    }

    cancelled_.insert(jobId);
    // The reply belongs to the thread blocked in ensureReady(); abort it there
    QMetaObject::invokeMethod(reply, [reply]() { reply->abort(); }, Qt::QueuedConnection);

    Logger::instance().info("ModelProvisioner: Cancelling download for job {}", jobId.toStdString());
    return true;
}

bool ModelProvisioner::isCancelled(const QString& jobId) const {
    QMutexLocker locker(&mutex_);
    return cancelled_.contains(jobId);
}

bool ModelProvisioner::isInstalled(const ModelDescriptor& descriptor) const {
    if (descriptor.isSelfManaged()) {
        return true;
    }
    const QFileInfo info(modelPath(descriptor));
    return info.isFile() && info.size() > 0;
}

QString ModelProvisioner::modelPath(const QString& modelId) const {
    auto descriptor = catalog_.find(modelId);
    if (descriptor.hasValue()) {
        return modelPath(descriptor.value());
    }
    return QDir(settings_.modelsPath).filePath(modelId + ".bin");
}

QString ModelProvisioner::modelPath(const ModelDescriptor& descriptor) const {
    const QString fileName = descriptor.fileName.isEmpty() ? descriptor.name + ".bin" : descriptor.fileName;
    return QDir(settings_.modelsPath).filePath(fileName);
}

QStringList ModelProvisioner::listInstalled() const {
    const QDir modelsDir(settings_.modelsPath);
    if (!modelsDir.exists()) {
        return {};
    }
    return modelsDir.entryList(QStringList{"*.bin"}, QDir::Files, QDir::Name);
}

bool ModelProvisioner::isAllowedUrl(const QUrl& url) const {
    return url.isValid() && !settings_.allowedUrlPrefix.isEmpty()
        && url.toString().startsWith(settings_.allowedUrlPrefix);
}

void ModelProvisioner::setNetworkAccessManager(QNetworkAccessManager* manager) {
    networkManager_ = manager;
}

} // namespace Scribe
