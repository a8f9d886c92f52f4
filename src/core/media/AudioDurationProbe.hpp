#pragma once

#include <QtCore/QString>

#include "../common/Expected.hpp"
#include "../common/PipelineError.hpp"

namespace Scribe {

// Duration query answered by the audio conversion layer
class AudioDurationProbe {
public:
    virtual ~AudioDurationProbe() = default;

    // Duration in milliseconds
    virtual Expected<qint64, PipelineError> durationMs(const QString& audioPath) = 0;
};

/**
 * @brief Reads the container duration with ffprobe.
 *
 * Runs "ffprobe -v quiet -print_format json -show_format <file>" and takes
 * format.duration from the JSON report.
 */
class FfprobeDurationProbe : public AudioDurationProbe {
public:
    explicit FfprobeDurationProbe(const QString& ffprobePath = "ffprobe", int timeoutMs = 10000);

    Expected<qint64, PipelineError> durationMs(const QString& audioPath) override;

private:
    QString ffprobePath_;
    int timeoutMs_;
};

} // namespace Scribe
