#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace Scribe {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& settingsFile) {
    settings_ = std::make_unique<QSettings>(settingsFile, QSettings::IniFormat);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized from {}", settingsFile.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    return getValue(key, defaultValue).toStringList();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

void Config::setDouble(const QString& key, double value) {
    setValue(key, value);
}

EngineSettings Config::getEngineSettings() const {
    EngineSettings settings;
    const QString resources = getString("engine/resourcesPath", getResourcesPath());
    settings.resourcesPath = resources;
    settings.program = getString("engine/program", "python3");
    settings.programArguments = getStringList("engine/programArguments",
        QStringList{resources + "/whisper_transcribe.py"});
    settings.maxConcurrent = qMax(1, getInt("engine/maxConcurrent", 1));
    settings.stderrTailLines = qMax(1, getInt("engine/stderrTailLines", 20));
    return settings;
}

ProvisionerSettings Config::getProvisionerSettings() const {
    ProvisionerSettings settings;
    settings.modelsPath = getString("models/path", getDataPath() + "/models");
    settings.allowedUrlPrefix = getString("models/allowedUrlPrefix", settings.allowedUrlPrefix);
    settings.timeoutSeconds = qMax(30, getInt("models/timeoutSeconds", 300));
    settings.maxRedirects = qMax(0, getInt("models/maxRedirects", 5));
    return settings;
}

DecodingOptions Config::getDecodingOptions() const {
    DecodingOptions options;
    options.language = getString("decoding/language", "auto");
    options.device = getString("decoding/device", "auto");
    options.fp16 = getBool("decoding/fp16", true);
    options.temperature = getDouble("decoding/temperature", 0.0);
    options.compressionRatioThreshold = getDouble("decoding/compressionRatioThreshold", 2.4);
    options.logprobThreshold = getDouble("decoding/logprobThreshold", -1.0);
    options.noSpeechThreshold = getDouble("decoding/noSpeechThreshold", 0.6);
    options.translate = getBool("decoding/translate", false);
    options.conditionOnPreviousText = getBool("decoding/conditionOnPreviousText", true);
    options.wordTimestamps = getBool("decoding/wordTimestamps", false);
    options.initialPrompt = getString("decoding/initialPrompt");
    return options;
}

QString Config::getDefaultModel() const {
    return getString("decoding/model", "base");
}

void Config::setEngineSettings(const EngineSettings& settings) {
    setValue("engine/program", settings.program);
    setValue("engine/programArguments", settings.programArguments);
    setValue("engine/resourcesPath", settings.resourcesPath);
    setValue("engine/maxConcurrent", settings.maxConcurrent);
    setValue("engine/stderrTailLines", settings.stderrTailLines);
}

void Config::setProvisionerSettings(const ProvisionerSettings& settings) {
    setValue("models/path", settings.modelsPath);
    setValue("models/allowedUrlPrefix", settings.allowedUrlPrefix);
    setValue("models/timeoutSeconds", settings.timeoutSeconds);
    setValue("models/maxRedirects", settings.maxRedirects);
}

void Config::setDecodingOptions(const DecodingOptions& options) {
    setValue("decoding/language", options.language);
    setValue("decoding/device", options.device);
    setValue("decoding/fp16", options.fp16);
    setValue("decoding/temperature", options.temperature);
    setValue("decoding/compressionRatioThreshold", options.compressionRatioThreshold);
    setValue("decoding/logprobThreshold", options.logprobThreshold);
    setValue("decoding/noSpeechThreshold", options.noSpeechThreshold);
    setValue("decoding/translate", options.translate);
    setValue("decoding/conditionOnPreviousText", options.conditionOnPreviousText);
    setValue("decoding/wordTimestamps", options.wordTimestamps);
    setValue("decoding/initialPrompt", options.initialPrompt);
}

void Config::setDefaultModel(const QString& modelId) {
    setValue("decoding/model", modelId);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

QString Config::getTempPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Scribe";
}

QString Config::getResourcesPath() const {
    return QCoreApplication::applicationDirPath() + "/resources";
}

QString Config::getLogFilePath() const {
    return getString("logging/file", getDataPath() + "/scribe.log");
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    QStringList paths = {
        getDataPath(),
        getCachePath(),
        getTempPath(),
        getString("models/path", getDataPath() + "/models")
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            SCRIBE_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Scribe
