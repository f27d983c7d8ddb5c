#include "network/client_relay.hpp"
#include "core/logging.hpp"
#include "network/direct_relay.hpp"
#include "network/envelope.hpp"
#include "network/tunnel_link.hpp"

#include <QTimer>
#include <QUdpSocket>

#include <algorithm>

namespace lanbridge::network {

ClientRelay::ClientRelay(core::Config config, QObject* parent)
    : Relay(parent)
    , config_(std::move(config))
{
    if (config_.client.direct_mode) {
        direct_ = std::make_unique<DirectRelay>(config_, config_.client.capture_address,
                                                config_.client.direct_device_address, this);
        connect(direct_.get(), &Relay::fatal, this, &Relay::fatal);
        connect(direct_.get(), &Relay::stopped, this, &Relay::stopped);
    }
}

ClientRelay::~ClientRelay() {
    if (pending_) {
        pending_->disconnect(this);
    }
    if (auto link = slot_.take()) {
        link->disconnect(this);
    }
}

Result<void> ClientRelay::start() {
    if (running_) {
        return Result<void>::ok();
    }

    if (direct_) {
        if (config_.client.direct_device_address.isEmpty()) {
            return Result<void>::err(Error{"direct mode needs a device address",
                                           ErrorCode::ConfigInvalid});
        }
        auto started = direct_->start();
        if (started.is_ok()) {
            running_ = true;
        }
        return started;
    }

    if (config_.client.remote_host.isEmpty()) {
        return Result<void>::err(Error{"no app-side relay host configured",
                                       ErrorCode::ConfigInvalid});
    }
    QHostAddress capture_addr;
    if (!capture_addr.setAddress(config_.client.capture_address)) {
        return Result<void>::err(Error{
            "invalid capture address: " + config_.client.capture_address.toStdString(),
            ErrorCode::ConfigInvalid});
    }

    capture_ = std::make_unique<QUdpSocket>(this);
    if (!capture_->bind(capture_addr, config_.discovery_port,
                        QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto message = "cannot capture on " + config_.client.capture_address.toStdString() + ":" +
                       std::to_string(config_.discovery_port) + ": " +
                       capture_->errorString().toStdString();
        capture_.reset();
        return Result<void>::err(Error{std::move(message), ErrorCode::BindFailed});
    }
    connect(capture_.get(), &QUdpSocket::readyRead, this, &ClientRelay::onCaptured);

    reconnect_timer_ = std::make_unique<QTimer>(this);
    reconnect_timer_->setInterval(config_.reconnect_interval);
    connect(reconnect_timer_.get(), &QTimer::timeout, this, &ClientRelay::onReconnectTick);
    reconnect_timer_->start();

    running_ = true;
    qCInfo(lanbridgeClientLog) << "Client relay capturing on" << config_.client.capture_address
                               << "port" << capturePort() << "tunneling to"
                               << config_.client.remote_host << "port" << config_.tunnel_port;
    return Result<void>::ok();
}

void ClientRelay::stop() {
    if (!running_) return;
    running_ = false;

    if (direct_) {
        direct_->stop();
        return;
    }

    if (reconnect_timer_) {
        reconnect_timer_->stop();
    }
    if (capture_) {
        capture_->close();
    }
    if (auto pending = std::move(pending_)) {
        pending->disconnect(this);
        pending->abort();
    }
    if (auto link = slot_.take()) {
        link->disconnect(this);
        link->abort();
    }
    setState(State::Disconnected);

    qCInfo(lanbridgeClientLog) << "Client relay stopped";
    emit stopped();
}

uint16_t ClientRelay::capturePort() const {
    return capture_ ? capture_->localPort() : 0;
}

void ClientRelay::setState(State state) {
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state_);
}

void ClientRelay::onReconnectTick() {
    if (!running_ || state_ != State::Disconnected) return;

    pending_ = TunnelLink::create();
    watchLink(pending_);
    setState(State::Connecting);

    qCDebug(lanbridgeClientLog) << "Dialing" << config_.client.remote_host << "port" << config_.tunnel_port;
    pending_->dial(config_.client.remote_host, config_.tunnel_port);
}

void ClientRelay::watchLink(const std::shared_ptr<TunnelLink>& link) {
    const TunnelLink* raw = link.get();

    connect(link.get(), &TunnelLink::connected, this, [this, raw]() {
        if (!pending_ || pending_.get() != raw) return;
        qCInfo(lanbridgeClientLog) << "Tunnel connected to" << pending_->peerName();
        slot_.replace(std::move(pending_));
        setState(State::Connected);
    });

    connect(link.get(), &TunnelLink::frameReceived, this, &ClientRelay::onFrame);

    connect(link.get(), &TunnelLink::failed, this, [this](const Error& error) {
        if (error.code == ErrorCode::HostNotFound) {
            qCCritical(lanbridgeClientLog) << "Cannot resolve" << config_.client.remote_host << ":"
                                           << error.message.c_str();
            if (reconnect_timer_) {
                reconnect_timer_->stop();
            }
            emit fatal(error);
            return;
        }
        qCWarning(lanbridgeClientLog) << "Tunnel error:" << error.message.c_str();
    });

    connect(link.get(), &TunnelLink::closed, this, [this, raw]() {
        if (pending_ && pending_.get() == raw) {
            pending_.reset();
            setState(State::Disconnected);
            return;
        }
        if (slot_.clear_if(raw)) {
            qCInfo(lanbridgeClientLog) << "Tunnel closed, reconnecting in"
                                       << config_.reconnect_interval.count() << "ms";
            setState(State::Disconnected);
        }
    });
}

void ClientRelay::onCaptured() {
    while (capture_ && capture_->hasPendingDatagrams()) {
        const auto pending = capture_->pendingDatagramSize();
        QByteArray datagram;
        datagram.resize(static_cast<int>(std::clamp<qint64>(pending, 0, config_.udp_buffer_size)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto n = capture_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (n < 0) {
            qCWarning(lanbridgeClientLog) << "Error reading capture socket:" << capture_->errorString();
            continue;
        }
        datagram.truncate(static_cast<int>(n));
        forward(datagram, sender, sender_port);
    }
}

void ClientRelay::forward(const QByteArray& datagram, const QHostAddress& sender,
                          quint16 sender_port) {
    auto link = slot_.current();
    if (state_ != State::Connected || !link) {
        qCDebug(lanbridgeClientLog) << "No tunnel, discarding datagram from"
                                    << sender.toString() << sender_port;
        return;
    }

    auto envelope = make_envelope(sender, sender_port, datagram);
    if (envelope.is_err()) {
        qCWarning(lanbridgeClientLog) << "Discarding datagram from" << sender.toString() << ":"
                                      << envelope.unwrap_err().message.c_str();
        return;
    }

    qCDebug(lanbridgeClientLog) << "Forwarding" << datagram.size() << "bytes from"
                                << sender.toString() << sender_port;
    auto sent = link->send_frame(encode_envelope(envelope.unwrap()));
    if (sent.is_err()) {
        qCWarning(lanbridgeClientLog) << "Cannot write to tunnel:" << sent.unwrap_err().message.c_str();
        // `closed` clears the slot and the next tick redials.
        link->abort();
    }
}

void ClientRelay::onFrame(const QByteArray& payload) {
    auto decoded = decode_envelope(payload);
    if (decoded.is_err()) {
        qCWarning(lanbridgeClientLog) << "Dropping tunnel frame:" << decoded.unwrap_err().message.c_str();
        return;
    }
    const Envelope& reply = decoded.unwrap();

    QUdpSocket socket;
    if (socket.writeDatagram(reply.payload, reply.origin_address(), reply.origin_port) < 0) {
        qCWarning(lanbridgeClientLog) << "Cannot deliver reply to" << reply.origin_string() << ":"
                                      << socket.errorString();
        return;
    }
    qCDebug(lanbridgeClientLog) << "Delivered" << reply.payload.size() << "bytes to" << reply.origin_string();
}

} // namespace lanbridge::network
