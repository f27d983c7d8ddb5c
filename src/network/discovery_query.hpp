#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <chrono>
#include <memory>

class QUdpSocket;
class QTimer;

namespace lanbridge::network {

/**
 * DiscoveryQuery - One outbound discovery datagram and its reply window.
 *
 * Sends the query from a fresh ephemeral UDP socket and reports every
 * datagram that arrives on that same socket until the timeout expires or
 * `max_replies` have been seen. The socket is the only correlation between
 * a query and its replies. `finished` is emitted exactly once; the owner
 * deletes the query afterwards.
 */
class DiscoveryQuery : public QObject {
    Q_OBJECT

public:
    struct Options {
        QHostAddress target;
        uint16_t port = 0;
        std::chrono::milliseconds timeout{500};
        int buffer_size = 4096;
        // 0 collects replies until the timeout.
        int max_replies = 0;
    };

    explicit DiscoveryQuery(Options options, QObject* parent = nullptr);
    ~DiscoveryQuery() override;

    /**
     * Bind the ephemeral socket, send `payload` and start the reply timer.
     * On failure nothing is sent and `finished` is never emitted.
     */
    Result<void> start(const QByteArray& payload);

    [[nodiscard]] int replyCount() const { return reply_count_; }

signals:
    void replyReceived(const QByteArray& reply, const QHostAddress& sender, quint16 sender_port);
    void finished(int reply_count);

private slots:
    void onReadyRead();
    void onTimeout();

private:
    void finish();

    Options options_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> timer_;
    int reply_count_ = 0;
    bool done_ = false;
};

} // namespace lanbridge::network
