#pragma once

#include "core/config.hpp"
#include "network/relay.hpp"

#include <QHostAddress>
#include <QString>
#include <memory>

class QUdpSocket;

namespace lanbridge::network {

/**
 * DirectRelay - Plain UDP passthrough to one known device, no tunnel.
 *
 * Each datagram captured on `bind_address:discovery_port` is forwarded to
 * the device from a fresh ephemeral socket. The first reply within the
 * reply timeout is sent back to the original sender from the capture
 * socket. Used by both roles when the device address is configured.
 */
class DirectRelay : public Relay {
    Q_OBJECT

public:
    DirectRelay(core::Config config, QString bind_address, QString device_address,
                QObject* parent = nullptr);
    ~DirectRelay() override;

    Result<void> start() override;
    void stop() override;

    [[nodiscard]] bool isRunning() const override { return running_; }

    // Actual bound port; differs from the configured one when that is 0.
    [[nodiscard]] uint16_t listenPort() const;
    [[nodiscard]] int inflightQueries() const { return inflight_; }

private slots:
    void onDatagrams();

private:
    void forward(const QByteArray& datagram, const QHostAddress& sender, quint16 sender_port);
    void queryFinished();

    core::Config config_;
    QString bind_address_;
    QString device_address_;
    QHostAddress device_;
    std::unique_ptr<QUdpSocket> socket_;
    int inflight_ = 0;
    bool running_ = false;
    bool stopping_ = false;
};

} // namespace lanbridge::network
