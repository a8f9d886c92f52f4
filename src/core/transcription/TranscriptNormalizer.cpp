#include "TranscriptNormalizer.hpp"
#include "DiagnosticDump.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

#include <cmath>

namespace Scribe {

namespace {

constexpr int MULTILINGUAL_VOCAB_SIZE = 51864;

// Largest time whose millisecond offset fits in qint64
constexpr double MAX_SECONDS = 9.0e15;

bool isValidTime(double seconds) {
    return std::isfinite(seconds) && seconds >= 0.0 && seconds <= MAX_SECONDS;
}

} // namespace

Expected<Transcript, PipelineError> TranscriptNormalizer::parse(const QByteArray& raw,
                                                               const QString& diagnosticBasePath) {
    auto document = parseDocument(raw);
    if (document.hasValue()) {
        SCRIBE_DEBUG("TranscriptNormalizer: Parsed {} segments, language {}",
                     document.value().segments.size(), document.value().language.toStdString());
        return document.value();
    }

    const QString reason = document.error();
    const QString dumpPath = DiagnosticDump::record(raw, diagnosticBasePath, reason);
    return makeUnexpected(PipelineError::parse(
        QString("Malformed engine output: %1").arg(reason), dumpPath));
}

Expected<Transcript, QString> TranscriptNormalizer::parseDocument(const QByteArray& raw) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return makeUnexpected(QString("%1 at offset %2").arg(parseError.errorString()).arg(parseError.offset));
    }
    if (!doc.isObject()) {
        return makeUnexpected(QString("document is not a JSON object"));
    }

    const QJsonObject root = doc.object();
    const QJsonValue language = root.value("language");
    if (!language.isString()) {
        return makeUnexpected(QString("\"language\" is missing or not a string"));
    }
    const QJsonValue segments = root.value("segments");
    if (!segments.isArray()) {
        return makeUnexpected(QString("\"segments\" is missing or not an array"));
    }

    Transcript transcript;
    transcript.language = language.toString();

    const QJsonArray segmentArray = segments.toArray();
    transcript.segments.reserve(segmentArray.size());
    for (int i = 0; i < segmentArray.size(); ++i) {
        const QJsonValue entry = segmentArray.at(i);
        if (!entry.isObject()) {
            return makeUnexpected(QString("segment %1 is not an object").arg(i));
        }

        const QJsonObject segment = entry.toObject();
        const QJsonValue start = segment.value("start");
        const QJsonValue end = segment.value("end");
        const QJsonValue text = segment.value("text");
        if (!start.isDouble() || !end.isDouble()) {
            return makeUnexpected(QString("segment %1 has a non-numeric start or end").arg(i));
        }
        if (!text.isString()) {
            return makeUnexpected(QString("segment %1 has no text").arg(i));
        }

        const double startSeconds = start.toDouble();
        const double endSeconds = end.toDouble();
        if (!isValidTime(startSeconds) || !isValidTime(endSeconds)) {
            return makeUnexpected(QString("segment %1 has a negative, invalid or out of range time").arg(i));
        }

        transcript.segments.append(makeSegment(startSeconds, endSeconds, text.toString()));
    }

    return transcript;
}

QString TranscriptNormalizer::formatTimestamp(double seconds) {
    if (!isValidTime(seconds)) {
        seconds = 0.0;
    }

    const qint64 hours = static_cast<qint64>(std::floor(seconds / 3600.0));
    const int minutes = static_cast<int>(std::floor(std::fmod(seconds, 3600.0) / 60.0));
    const int secs = static_cast<int>(std::floor(std::fmod(seconds, 60.0)));
    const int ms = static_cast<int>(std::floor(std::fmod(seconds, 1.0) * 1000.0));

    return QString("%1:%2:%3.%4")
           .arg(hours, 2, 10, QChar('0'))
           .arg(minutes, 2, 10, QChar('0'))
           .arg(secs, 2, 10, QChar('0'))
           .arg(ms, 3, 10, QChar('0'));
}

qint64 TranscriptNormalizer::toMilliseconds(double seconds) {
    if (!isValidTime(seconds)) {
        return 0;
    }
    return qRound64(seconds * 1000.0);
}

TranscriptSegment TranscriptNormalizer::makeSegment(double start, double end, const QString& text) {
    TranscriptSegment segment;
    segment.start = start;
    segment.end = end;
    segment.fromTimestamp = formatTimestamp(start);
    segment.toTimestamp = formatTimestamp(end);
    segment.fromOffset = toMilliseconds(start);
    segment.toOffset = toMilliseconds(end);
    segment.text = text;
    return segment;
}

QJsonObject TranscriptNormalizer::toJson(const Transcript& transcript, const ArtifactContext& context) {
    QJsonObject model;
    model["type"] = context.modelName;
    model["multilingual"] = context.multilingual;
    model["vocab"] = MULTILINGUAL_VOCAB_SIZE;
    model["audio"] = QJsonObject();

    QJsonObject params;
    params["model"] = context.modelPath.isEmpty() ? context.modelName : context.modelPath;
    params["language"] = transcript.language;
    params["translate"] = context.translate;

    QJsonObject result;
    result["language"] = transcript.language;

    QJsonArray transcription;
    for (const auto& segment : transcript.segments) {
        QJsonObject timestamps;
        timestamps["from"] = segment.fromTimestamp;
        timestamps["to"] = segment.toTimestamp;

        QJsonObject offsets;
        offsets["from"] = segment.fromOffset;
        offsets["to"] = segment.toOffset;

        QJsonObject entry;
        entry["timestamps"] = timestamps;
        entry["offsets"] = offsets;
        entry["text"] = segment.text;
        if (!segment.speaker.isEmpty()) {
            entry["speaker"] = segment.speaker;
        }
        transcription.append(entry);
    }

    QJsonObject root;
    root["systeminfo"] = context.systemInfo;
    root["model"] = model;
    root["params"] = params;
    root["result"] = result;
    root["transcription"] = transcription;
    return root;
}

Expected<QString, PipelineError> TranscriptNormalizer::writeArtifact(const QString& path,
                                                                     const Transcript& transcript,
                                                                     const ArtifactContext& context) {
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return makeUnexpected(PipelineError::storage(
            QString("Cannot create directory %1").arg(info.absolutePath())));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return makeUnexpected(PipelineError::storage(
            QString("Cannot open %1 for writing: %2").arg(path, file.errorString())));
    }

    const QByteArray payload = QJsonDocument(toJson(transcript, context)).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        return makeUnexpected(PipelineError::storage(
            QString("Cannot write transcript %1: %2").arg(path, file.errorString())));
    }

    Logger::instance().info("TranscriptNormalizer: Wrote {} segments to {}",
                            transcript.segments.size(), path.toStdString());
    return path;
}

} // namespace Scribe
