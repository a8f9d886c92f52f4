#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <functional>

namespace Scribe {

// Receives a completion fraction in [0,1]
using ProgressCallback = std::function<void(double)>;

// Polled at registration points; true once the owning job was cancelled
using CancelCheck = std::function<bool()>;

struct DecodingOptions {
    QString language = "auto";              // Language code or "auto" for detection
    QString device = "auto";                // auto, cuda, cpu
    bool fp16 = true;                       // FP16 inference on GPU
    double temperature = 0.0;               // Sampling temperature (0 = greedy)
    double compressionRatioThreshold = 2.4; // Gzip ratio above which decoding is treated as failed
    double logprobThreshold = -1.0;         // Average log probability below which decoding is treated as failed
    double noSpeechThreshold = 0.6;         // No-speech probability threshold
    bool translate = false;                 // Translate to English
    bool conditionOnPreviousText = true;    // Feed previous window text as prompt
    bool wordTimestamps = false;            // Word-level timestamps
    QString initialPrompt;                  // Prompt for the first window
};

struct TranscriptionRequest {
    QString audioPath;
    QString modelId;        // Catalog name passed to the engine (or local weights path)
    DecodingOptions options;
};

struct TranscriptSegment {
    double start = 0.0;     // seconds, engine precision
    double end = 0.0;
    QString fromTimestamp;  // HH:MM:SS.mmm
    QString toTimestamp;
    qint64 fromOffset = 0;  // milliseconds
    qint64 toOffset = 0;
    QString text;
    QString speaker;        // Assigned downstream, empty here

    qint64 duration() const {
        return toOffset - fromOffset;
    }
};

struct Transcript {
    QString language;
    QList<TranscriptSegment> segments;
};

struct EngineSettings {
    QString program = "python3";            // Engine executable or interpreter
    QStringList programArguments;           // Arguments placed before the request arguments
    QString resourcesPath;                  // Working directory, prepended to PATH
    int maxConcurrent = 1;                  // Simultaneous engine processes
    int stderrTailLines = 20;               // Lines of stderr kept for failure reports
};

struct ProvisionerSettings {
    QString modelsPath;
    QString allowedUrlPrefix = "https://huggingface.co/ggerganov/whisper.cpp";
    int timeoutSeconds = 300;
    int maxRedirects = 5;
    QString userAgent = "Scribe/1.0";
};

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::Transcript)
