#include "DiagnosticDump.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

#include <algorithm>
#include <exception>

namespace Scribe {

void DiagnosticDump::logSummary(const QByteArray& raw, const QString& reason) {
    try {
        const qsizetype length = raw.size();
        const qsizetype firstBrace = raw.indexOf('{');
        const qsizetype lastBrace = raw.lastIndexOf('}');

        Logger::instance().error("Failed to parse engine output: {}", reason.toStdString());
        Logger::instance().error("Raw output length: {}", length);
        Logger::instance().error("First '{{' at: {}, last '}}' at: {}", firstBrace, lastBrace);

        const qsizetype previewStart = std::max<qsizetype>(0, lastBrace - PREVIEW_RADIUS);
        const qsizetype previewEnd = std::min<qsizetype>(length, lastBrace + PREVIEW_RADIUS);
        if (previewEnd > previewStart) {
            Logger::instance().error("Tail preview (around last brace, {}-{}):", previewStart, previewEnd);
            Logger::instance().error("{}", raw.mid(previewStart, previewEnd - previewStart).toStdString());
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to create tail preview: {}", e.what());
    }
}

QString DiagnosticDump::write(const QByteArray& raw, const QString& basePath) {
    if (basePath.isEmpty()) {
        return QString();
    }

    const QString path = dumpPath(basePath);
    try {
        const QFileInfo info(path);
        if (!QDir().mkpath(info.absolutePath())) {
            Logger::instance().error("Failed to create directory for raw engine output: {}",
                                     info.absolutePath().toStdString());
            return QString();
        }

        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            Logger::instance().error("Failed to write raw engine output to {}: {}",
                                     path.toStdString(), file.errorString().toStdString());
            return QString();
        }
        if (file.write(raw) != raw.size()) {
            Logger::instance().error("Short write of raw engine output to {}: {}",
                                     path.toStdString(), file.errorString().toStdString());
            file.close();
            return QString();
        }
        file.close();
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to write raw engine output to disk: {}", e.what());
        return QString();
    }

    Logger::instance().error("Wrote raw engine output to {} for debugging.", path.toStdString());
    return path;
}

QString DiagnosticDump::record(const QByteArray& raw, const QString& basePath, const QString& reason) {
    logSummary(raw, reason);
    return write(raw, basePath);
}

QString DiagnosticDump::dumpPath(const QString& basePath) {
    return basePath + ".raw.txt";
}

} // namespace Scribe
