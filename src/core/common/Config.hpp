#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

#include "../transcription/TranscriptionTypes.hpp"

namespace Scribe {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Scribe",
                    const QString& applicationName = "ScribeTranscriber");

    // Uses an explicit settings file instead of the platform store (tests, --config)
    void initializeFromFile(const QString& settingsFile);

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);
    void setDouble(const QString& key, double value);

    // Application-specific settings
    EngineSettings getEngineSettings() const;
    ProvisionerSettings getProvisionerSettings() const;
    DecodingOptions getDecodingOptions() const;
    QString getDefaultModel() const;

    void setEngineSettings(const EngineSettings& settings);
    void setProvisionerSettings(const ProvisionerSettings& settings);
    void setDecodingOptions(const DecodingOptions& options);
    void setDefaultModel(const QString& modelId);

    // Paths
    QString getDataPath() const;
    QString getCachePath() const;
    QString getTempPath() const;
    QString getResourcesPath() const;
    QString getLogFilePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Scribe
