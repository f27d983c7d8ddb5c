#pragma once

#include "core/config.hpp"
#include "network/relay.hpp"
#include "network/tunnel_slot.hpp"

#include <QByteArray>
#include <memory>
#include <unordered_map>

class QTcpServer;

namespace lanbridge::network {

class DirectRelay;
class TunnelLink;
struct Envelope;

/**
 * AppRelay - The relay that runs on the device's network.
 *
 * Accepts tunnel connections from client-side relays. Each envelope read
 * from a link is re-broadcast on the local network from its own ephemeral
 * socket; every reply seen within the reply timeout is wrapped with the
 * original origin and written back through the currently held link.
 *
 * Only the most recently accepted link is written to. Earlier links are
 * not closed and keep delivering queries until their peer goes away.
 *
 * With `app.direct_device_address` set it runs a DirectRelay instead.
 */
class AppRelay : public Relay {
    Q_OBJECT

public:
    explicit AppRelay(core::Config config, QObject* parent = nullptr);
    ~AppRelay() override;

    Result<void> start() override;
    void stop() override;

    [[nodiscard]] bool isRunning() const override { return running_; }
    [[nodiscard]] bool isDirectMode() const { return direct_ != nullptr; }

    [[nodiscard]] uint16_t tunnelPort() const;
    [[nodiscard]] bool hasTunnel() const { return slot_.has_link(); }
    [[nodiscard]] int inflightQueries() const { return inflight_; }
    [[nodiscard]] int linkCount() const { return static_cast<int>(links_.size()); }

private slots:
    void onNewConnection();

private:
    void adoptLink(std::shared_ptr<TunnelLink> link);
    void onFrame(const QByteArray& payload);
    void sendReply(const Envelope& reply);
    void queryFinished();

    core::Config config_;
    std::unique_ptr<DirectRelay> direct_;
    std::unique_ptr<QTcpServer> server_;
    TunnelSlot slot_;
    // Every live link, including ones superseded in the slot.
    std::unordered_map<const TunnelLink*, std::shared_ptr<TunnelLink>> links_;
    int inflight_ = 0;
    bool running_ = false;
    bool stopping_ = false;
};

} // namespace lanbridge::network
