#pragma once

#include "core/config.hpp"
#include "network/relay.hpp"
#include "network/tunnel_slot.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <memory>

class QTimer;
class QUdpSocket;

namespace lanbridge::network {

class DirectRelay;
class TunnelLink;

/**
 * ClientRelay - The relay that runs next to the discovering applications.
 *
 * Captures discovery broadcasts on the local segment and forwards each one,
 * tagged with its sender, through the tunnel to the app-side relay. Replies
 * coming back through the tunnel are unicast to the sender named in them.
 *
 * The tunnel is dialed on a fixed interval while disconnected. Datagrams
 * captured while there is no tunnel are discarded, never queued.
 *
 * With `client.direct_mode` set it runs a DirectRelay against
 * `client.direct_device_address` instead.
 */
class ClientRelay : public Relay {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Connected
    };
    Q_ENUM(State)

    explicit ClientRelay(core::Config config, QObject* parent = nullptr);
    ~ClientRelay() override;

    Result<void> start() override;
    void stop() override;

    [[nodiscard]] bool isRunning() const override { return running_; }
    [[nodiscard]] bool isDirectMode() const { return direct_ != nullptr; }

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] uint16_t capturePort() const;

signals:
    void stateChanged(lanbridge::network::ClientRelay::State state);

private slots:
    void onReconnectTick();
    void onCaptured();

private:
    void setState(State state);
    void watchLink(const std::shared_ptr<TunnelLink>& link);
    void forward(const QByteArray& datagram, const QHostAddress& sender, quint16 sender_port);
    void onFrame(const QByteArray& payload);

    core::Config config_;
    std::unique_ptr<DirectRelay> direct_;
    std::unique_ptr<QUdpSocket> capture_;
    std::unique_ptr<QTimer> reconnect_timer_;
    // Link being dialed; moves into slot_ once connected.
    std::shared_ptr<TunnelLink> pending_;
    TunnelSlot slot_;
    State state_ = State::Disconnected;
    bool running_ = false;
};

} // namespace lanbridge::network
