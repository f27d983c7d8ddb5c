#pragma once

#include "core/result.hpp"
#include "network/message_codec.hpp"

#include <QAbstractSocket>
#include <QByteArray>
#include <QObject>
#include <QString>
#include <memory>

class QTcpSocket;

namespace lanbridge::network {

/**
 * TunnelLink - One TCP tunnel connection and its private frame decoder.
 *
 * Created either from a socket accepted by the app-side listener or by
 * dialing the app-side relay. Emits each decoded frame payload in stream
 * order. Any read or write error ends the link: `failed` is emitted with the
 * cause, followed by `closed`. The link never reconnects by itself.
 */
class TunnelLink : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Connecting,
        Connected,
        Closed
    };

    /**
     * Wrap an accepted, already connected socket. Takes ownership.
     */
    explicit TunnelLink(QTcpSocket* accepted, QObject* parent = nullptr);

    /**
     * Create an unconnected link; call dial() to connect it.
     */
    explicit TunnelLink(QObject* parent = nullptr);
    ~TunnelLink() override;

    /**
     * Shared handles for relays; the link is released with deleteLater() so
     * dropping the last reference from inside one of its signals is safe.
     */
    static std::shared_ptr<TunnelLink> create(QTcpSocket* accepted);
    static std::shared_ptr<TunnelLink> create();

    /**
     * Start an asynchronous connect. Hostnames are resolved first; a
     * resolution failure is reported as `failed` with HostNotFound.
     */
    void dial(const QString& host, uint16_t port);

    /**
     * Frame and write `payload`. Fails with TunnelWriteFailed when the link
     * is not connected or the socket rejects the write.
     */
    Result<void> send_frame(const QByteArray& payload);

    /**
     * Drop the socket immediately without a graceful shutdown.
     */
    void abort();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] QString peerName() const;

signals:
    void connected();
    void frameReceived(const QByteArray& payload);
    void failed(const lanbridge::Error& error);
    void closed();

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();

private:
    void attachSocket();
    void close(const Error& cause);

    std::unique_ptr<QTcpSocket> socket_;
    MessageCodec codec_;
    State state_ = State::Idle;
    QString peer_name_;
};

} // namespace lanbridge::network
