#include "ModelCatalog.hpp"

namespace Scribe {

namespace {

constexpr qint64 MiB = 1024 * 1024;

const QString WHISPER_CPP_REPO_URL = "https://huggingface.co/ggerganov/whisper.cpp";

ModelDescriptor selfManaged(const QString& name, qint64 sizeMb, bool englishOnly) {
    ModelDescriptor model;
    model.name = name;
    model.approximateSize = QString("~%1MB").arg(sizeMb);
    model.approximateBytes = sizeMb * MiB;
    model.englishOnly = englishOnly;
    model.source = ModelSource::SelfManaged;
    return model;
}

ModelDescriptor ggml(const QString& variant, qint64 sizeMb, bool englishOnly) {
    ModelDescriptor model;
    model.name = "ggml-" + variant;
    model.approximateSize = QString("~%1MB").arg(sizeMb);
    model.approximateBytes = sizeMb * MiB;
    model.englishOnly = englishOnly;
    model.source = ModelSource::Remote;
    model.fileName = "ggml-" + variant + ".bin";
    model.url = WHISPER_CPP_REPO_URL + "/resolve/main/" + model.fileName;
    return model;
}

} // namespace

ModelCatalog::ModelCatalog(const QList<ModelDescriptor>& models)
    : models_(models) {
    for (int i = 0; i < models_.size(); ++i) {
        index_.insert(models_.at(i).name, i);
    }
}

const ModelCatalog& ModelCatalog::builtin() {
    static const ModelCatalog catalog({
        // PyTorch checkpoints, fetched by the engine itself
        selfManaged("tiny", 39, false),
        selfManaged("tiny.en", 39, true),
        selfManaged("base", 74, false),
        selfManaged("base.en", 74, true),
        selfManaged("small", 244, false),
        selfManaged("small.en", 244, true),
        selfManaged("medium", 769, false),
        selfManaged("medium.en", 769, true),
        selfManaged("large", 1550, false),
        selfManaged("large-v1", 1550, false),
        selfManaged("large-v2", 1550, false),
        selfManaged("large-v3", 1550, false),
        selfManaged("turbo", 809, false),

        // ggml weights downloaded by the provisioner
        ggml("tiny", 75, false),
        ggml("tiny.en", 75, true),
        ggml("base", 142, false),
        ggml("base.en", 142, true),
        ggml("base-q5_1", 57, false),
        ggml("small", 466, false),
        ggml("small.en", 466, true),
        ggml("medium", 1500, false),
        ggml("medium.en", 1500, true),
        ggml("large-v3", 2900, false),
        ggml("large-v3-turbo", 1500, false)
    });
    return catalog;
}

Expected<ModelDescriptor, PipelineError> ModelCatalog::find(const QString& modelId) const {
    auto it = index_.constFind(modelId);
    if (it == index_.constEnd()) {
        return makeUnexpected(PipelineError::validation(
            QString("Model \"%1\" is not in the model catalog").arg(modelId)));
    }
    return models_.at(it.value());
}

bool ModelCatalog::contains(const QString& modelId) const {
    return index_.contains(modelId);
}

QStringList ModelCatalog::names() const {
    QStringList result;
    result.reserve(models_.size());
    for (const auto& model : models_) {
        result.append(model.name);
    }
    return result;
}

const QList<ModelDescriptor>& ModelCatalog::models() const {
    return models_;
}

} // namespace Scribe
