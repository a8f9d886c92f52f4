#include "ProcessOutputSink.hpp"

#include <utility>

namespace Scribe {

ProcessOutputSink::ProcessOutputSink(int tailLimit, LineHandler onStderrLine)
    : tailLimit_(tailLimit > 0 ? tailLimit : 1)
    , onStderrLine_(std::move(onStderrLine)) {
}

void ProcessOutputSink::appendStdout(const QByteArray& chunk) {
    stdout_.append(chunk);
}

void ProcessOutputSink::appendStderr(const QByteArray& chunk) {
    pendingStderr_.append(chunk);

    int start = 0;
    for (int i = 0; i < pendingStderr_.size(); ++i) {
        const char c = pendingStderr_.at(i);
        if (c == '\n' || c == '\r') {
            emitLine(pendingStderr_.mid(start, i - start));
            start = i + 1;
        }
    }
    pendingStderr_.remove(0, start);
}

void ProcessOutputSink::finish() {
    if (!pendingStderr_.isEmpty()) {
        emitLine(pendingStderr_);
        pendingStderr_.clear();
    }
}

QByteArray ProcessOutputSink::takeStdout() {
    QByteArray result;
    result.swap(stdout_);
    return result;
}

void ProcessOutputSink::discardStdout() {
    stdout_.clear();
}

void ProcessOutputSink::emitLine(const QByteArray& rawLine) {
    // "\r\n" and carriage-return redraws produce empty fragments
    const QString line = QString::fromUtf8(rawLine).trimmed();
    if (line.isEmpty()) {
        return;
    }

    ++lineCount_;
    tail_.append(line);
    while (tail_.size() > tailLimit_) {
        tail_.removeFirst();
    }

    if (onStderrLine_) {
        onStderrLine_(line);
    }
}

} // namespace Scribe
