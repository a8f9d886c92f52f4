#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>

namespace Scribe {

/**
 * @brief Output collected from one engine process.
 *
 * Stdout is kept verbatim in a single buffer and is never inspected while the
 * process runs. Stderr is split into lines on '\n' or '\r' (progress bars
 * rewrite their line with '\r'); a trailing partial line is held back until it
 * is completed or finish() is called. Only the last tailLimit lines are kept.
 */
class ProcessOutputSink {
public:
    using LineHandler = std::function<void(const QString&)>;

    explicit ProcessOutputSink(int tailLimit = 20, LineHandler onStderrLine = LineHandler());

    void appendStdout(const QByteArray& chunk);
    void appendStderr(const QByteArray& chunk);

    // Flushes a pending partial stderr line
    void finish();

    const QByteArray& stdoutBuffer() const { return stdout_; }
    QByteArray takeStdout();
    void discardStdout();

    QStringList stderrTail() const { return tail_; }
    qint64 stderrLineCount() const { return lineCount_; }

private:
    void emitLine(const QByteArray& rawLine);

    int tailLimit_;
    LineHandler onStderrLine_;
    QByteArray stdout_;
    QByteArray pendingStderr_;
    QStringList tail_;
    qint64 lineCount_ = 0;
};

} // namespace Scribe
