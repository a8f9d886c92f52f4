#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

namespace Scribe {

// Metadata recorded next to the segments in the persisted transcript
struct ArtifactContext {
    QString modelName;
    QString modelPath;
    bool multilingual = true;
    bool translate = false;
    QString systemInfo = "PyTorch Whisper";
};

/**
 * @brief Turns complete engine stdout into a Transcript.
 *
 * The engine prints one JSON document:
 * {"language": "en", "segments": [{"start": 0.0, "end": 1.5, "text": "..."}]}
 *
 * Parsing is all-or-nothing. On any failure the raw bytes are preserved via
 * DiagnosticDump and OutputParseError is returned; a partially filled
 * Transcript is never produced.
 */
class TranscriptNormalizer {
public:
    static Expected<Transcript, PipelineError> parse(const QByteArray& raw,
                                                     const QString& diagnosticBasePath = QString());

    // HH:MM:SS.mmm, hours unbounded, milliseconds truncated
    static QString formatTimestamp(double seconds);

    // Rounded to the nearest millisecond
    static qint64 toMilliseconds(double seconds);

    static TranscriptSegment makeSegment(double start, double end, const QString& text);

    // whisper.cpp compatible layout
    static QJsonObject toJson(const Transcript& transcript, const ArtifactContext& context);

    static Expected<QString, PipelineError> writeArtifact(const QString& path,
                                                          const Transcript& transcript,
                                                          const ArtifactContext& context);

private:
    static Expected<Transcript, QString> parseDocument(const QByteArray& raw);
};

} // namespace Scribe
