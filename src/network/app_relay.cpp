#include "network/app_relay.hpp"
#include "core/logging.hpp"
#include "network/direct_relay.hpp"
#include "network/discovery_query.hpp"
#include "network/envelope.hpp"
#include "network/tunnel_link.hpp"

#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>

namespace lanbridge::network {

AppRelay::AppRelay(core::Config config, QObject* parent)
    : Relay(parent)
    , config_(std::move(config))
{
    if (!config_.app.direct_device_address.isEmpty()) {
        direct_ = std::make_unique<DirectRelay>(config_, config_.app.bind_address,
                                                config_.app.direct_device_address, this);
        connect(direct_.get(), &Relay::fatal, this, &Relay::fatal);
        connect(direct_.get(), &Relay::stopped, this, &Relay::stopped);
    }
}

AppRelay::~AppRelay() {
    for (auto& [raw, link] : links_) {
        link->disconnect(this);
    }
}

Result<void> AppRelay::start() {
    if (running_) {
        return Result<void>::ok();
    }

    if (direct_) {
        auto started = direct_->start();
        if (started.is_ok()) {
            running_ = true;
        }
        return started;
    }

    QHostAddress bind_addr;
    if (!bind_addr.setAddress(config_.app.bind_address)) {
        return Result<void>::err(Error{
            "invalid bind address: " + config_.app.bind_address.toStdString(),
            ErrorCode::ConfigInvalid});
    }
    QHostAddress broadcast;
    if (!broadcast.setAddress(config_.app.broadcast_address)) {
        return Result<void>::err(Error{
            "invalid broadcast address: " + config_.app.broadcast_address.toStdString(),
            ErrorCode::ConfigInvalid});
    }

    server_ = std::make_unique<QTcpServer>(this);
    connect(server_.get(), &QTcpServer::newConnection, this, &AppRelay::onNewConnection);
    if (!server_->listen(bind_addr, config_.tunnel_port)) {
        auto message = "cannot listen on " + config_.app.bind_address.toStdString() + ":" +
                       std::to_string(config_.tunnel_port) + ": " +
                       server_->errorString().toStdString();
        server_.reset();
        return Result<void>::err(Error{std::move(message), ErrorCode::BindFailed});
    }

    running_ = true;
    stopping_ = false;
    qCInfo(lanbridgeAppLog) << "App relay listening on" << config_.app.bind_address
                            << "port" << tunnelPort()
                            << "broadcasting to" << config_.app.broadcast_address
                            << "port" << config_.effective_device_port();
    return Result<void>::ok();
}

void AppRelay::stop() {
    if (!running_) return;
    running_ = false;

    if (direct_) {
        direct_->stop();
        return;
    }

    stopping_ = true;
    if (server_) {
        server_->close();
    }

    // Aborting emits `closed`, which erases from links_; iterate a copy.
    auto links = links_;
    for (auto& [raw, link] : links) {
        link->abort();
    }
    links_.clear();
    slot_.take();

    qCInfo(lanbridgeAppLog) << "App relay stopping," << inflight_ << "queries in flight";
    if (inflight_ == 0) {
        stopping_ = false;
        emit stopped();
    }
}

uint16_t AppRelay::tunnelPort() const {
    return server_ ? server_->serverPort() : 0;
}

void AppRelay::onNewConnection() {
    while (server_ && server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        if (!socket) break;
        adoptLink(TunnelLink::create(socket));
    }
}

void AppRelay::adoptLink(std::shared_ptr<TunnelLink> link) {
    const TunnelLink* raw = link.get();
    qCInfo(lanbridgeAppLog) << "Tunnel connection from" << link->peerName();

    connect(link.get(), &TunnelLink::frameReceived, this, &AppRelay::onFrame);
    connect(link.get(), &TunnelLink::failed, this, [raw](const Error& error) {
        qCWarning(lanbridgeAppLog) << "Tunnel link" << static_cast<const void*>(raw)
                                   << "failed:" << error.message.c_str();
    });
    connect(link.get(), &TunnelLink::closed, this, [this, raw]() {
        if (slot_.clear_if(raw)) {
            qCInfo(lanbridgeAppLog) << "Active tunnel closed";
        }
        links_.erase(raw);
    });

    links_.emplace(raw, link);
    if (slot_.replace(std::move(link))) {
        qCDebug(lanbridgeAppLog) << "Superseded the previously held tunnel link";
    }
}

void AppRelay::onFrame(const QByteArray& payload) {
    if (!running_) return;

    auto decoded = decode_envelope(payload);
    if (decoded.is_err()) {
        qCWarning(lanbridgeAppLog) << "Dropping tunnel frame:" << decoded.unwrap_err().message.c_str();
        return;
    }
    Envelope request = std::move(decoded).unwrap();

    if (config_.max_inflight_queries > 0 && inflight_ >= config_.max_inflight_queries) {
        qCWarning(lanbridgeAppLog) << "Dropping query from" << request.origin_string()
                                   << "," << inflight_ << "queries already in flight";
        return;
    }

    qCDebug(lanbridgeAppLog) << "Query of" << request.payload.size() << "bytes from"
                             << request.origin_string();

    auto* query = new DiscoveryQuery(
        DiscoveryQuery::Options{
            .target = QHostAddress(config_.app.broadcast_address),
            .port = config_.effective_device_port(),
            .timeout = config_.reply_timeout,
            .buffer_size = config_.udp_buffer_size,
            .max_replies = 0,
        },
        this);

    const uint32_t origin_ipv4 = request.origin_ipv4;
    const uint16_t origin_port = request.origin_port;
    connect(query, &DiscoveryQuery::replyReceived, this,
            [this, origin_ipv4, origin_port](const QByteArray& reply, const QHostAddress& sender,
                                             quint16) {
                qCDebug(lanbridgeAppLog) << "Reply of" << reply.size() << "bytes from" << sender.toString();
                sendReply(Envelope{
                    .origin_ipv4 = origin_ipv4,
                    .origin_port = origin_port,
                    .payload = reply,
                });
            });
    connect(query, &DiscoveryQuery::finished, this, [this, query](int) {
        query->deleteLater();
        queryFinished();
    });

    auto started = query->start(request.payload);
    if (started.is_err()) {
        qCWarning(lanbridgeAppLog) << "Broadcast failed:" << started.unwrap_err().message.c_str();
        query->deleteLater();
        return;
    }
    ++inflight_;
}

void AppRelay::sendReply(const Envelope& reply) {
    auto link = slot_.current();
    if (!link) {
        qCDebug(lanbridgeAppLog) << "No tunnel held, dropping reply for" << reply.origin_string();
        return;
    }

    auto sent = link->send_frame(encode_envelope(reply));
    if (sent.is_err()) {
        qCWarning(lanbridgeAppLog) << "Cannot send reply to tunnel:" << sent.unwrap_err().message.c_str();
        // `closed` releases the slot.
        link->abort();
    }
}

void AppRelay::queryFinished() {
    --inflight_;
    if (stopping_ && inflight_ == 0) {
        stopping_ = false;
        emit stopped();
    }
}

} // namespace lanbridge::network
