#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace Scribe {

/**
 * @brief Preserves engine output that could not be parsed.
 *
 * Nothing here fails: problems while logging or writing the dump are logged
 * and swallowed so the caller can still report the original parse error.
 */
class DiagnosticDump {
public:
    static constexpr int PREVIEW_RADIUS = 200;

    // Logs length, brace positions and the window around the last '}'
    static void logSummary(const QByteArray& raw, const QString& reason);

    /**
     * @brief Writes raw verbatim to dumpPath(basePath).
     * @return The dump path, or an empty string when nothing was written
     */
    static QString write(const QByteArray& raw, const QString& basePath);

    // logSummary() followed by write()
    static QString record(const QByteArray& raw, const QString& basePath, const QString& reason);

    static QString dumpPath(const QString& basePath);
};

} // namespace Scribe
