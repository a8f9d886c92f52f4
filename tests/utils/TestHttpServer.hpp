#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtNetwork/QTcpServer>

namespace Scribe {
namespace Test {

/**
 * @brief Minimal HTTP/1.1 server on 127.0.0.1 that trickles one payload.
 *
 * Every GET is answered with the payload in fixed-size chunks, one chunk per
 * interval. With a stall point the server stops sending after that many
 * bytes and keeps the connection open. Lives in the test thread, so the
 * client must run its own event loop (as ModelProvisioner does).
 */
class TestHttpServer : public QObject {
    Q_OBJECT

public:
    explicit TestHttpServer(QObject* parent = nullptr);

    bool listen();
    QString baseUrl() const;

    void setPayload(const QByteArray& payload) { payload_ = payload; }
    void setChunking(int chunkSize, int intervalMs);
    void setStallAfter(qint64 bytes) { stallAfter_ = bytes; }

    int requestCount() const { return requestCount_; }

private:
    void handleConnection();

    QTcpServer server_;
    QByteArray payload_;
    int chunkSize_ = 16 * 1024;
    int intervalMs_ = 0;
    qint64 stallAfter_ = -1;
    int requestCount_ = 0;
};

} // namespace Test
} // namespace Scribe
