#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QList>
#include <QtCore/QHash>

#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

namespace Scribe {

enum class ModelSource {
    SelfManaged,    // The engine downloads and caches the weights on first use
    Remote          // Weights are fetched from url into fileName by the provisioner
};

struct ModelDescriptor {
    QString name;
    QString approximateSize;    // Display string, e.g. "~74MB"
    qint64 approximateBytes = 0;
    bool englishOnly = false;
    ModelSource source = ModelSource::SelfManaged;
    QString url;
    QString fileName;

    bool isSelfManaged() const {
        return source == ModelSource::SelfManaged;
    }
};

/**
 * @brief Static registry of known speech models.
 *
 * Lookups never touch the network or the filesystem.
 */
class ModelCatalog {
public:
    explicit ModelCatalog(const QList<ModelDescriptor>& models);

    // Catalog shipped with the application
    static const ModelCatalog& builtin();

    Expected<ModelDescriptor, PipelineError> find(const QString& modelId) const;
    bool contains(const QString& modelId) const;
    QStringList names() const;
    const QList<ModelDescriptor>& models() const;

private:
    QList<ModelDescriptor> models_;
    QHash<QString, int> index_;
};

} // namespace Scribe
