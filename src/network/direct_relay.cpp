#include "network/direct_relay.hpp"
#include "core/logging.hpp"
#include "network/discovery_query.hpp"

#include <QUdpSocket>

#include <algorithm>

namespace lanbridge::network {

DirectRelay::DirectRelay(core::Config config, QString bind_address, QString device_address,
                         QObject* parent)
    : Relay(parent)
    , config_(std::move(config))
    , bind_address_(std::move(bind_address))
    , device_address_(std::move(device_address))
{
}

DirectRelay::~DirectRelay() = default;

Result<void> DirectRelay::start() {
    if (running_) {
        return Result<void>::ok();
    }

    if (!device_.setAddress(device_address_)) {
        return Result<void>::err(Error{
            "invalid device address: " + device_address_.toStdString(),
            ErrorCode::ConfigInvalid});
    }
    QHostAddress bind_addr;
    if (!bind_addr.setAddress(bind_address_)) {
        return Result<void>::err(Error{
            "invalid bind address: " + bind_address_.toStdString(),
            ErrorCode::ConfigInvalid});
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(bind_addr, config_.discovery_port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto message = "cannot listen on " + bind_address_.toStdString() + ":" +
                       std::to_string(config_.discovery_port) + ": " +
                       socket_->errorString().toStdString();
        socket_.reset();
        return Result<void>::err(Error{std::move(message), ErrorCode::BindFailed});
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &DirectRelay::onDatagrams);

    running_ = true;
    stopping_ = false;
    qCInfo(lanbridgeDirectLog) << "Direct relay listening on" << bind_address_ << "port" << listenPort()
                               << "for device" << device_.toString();
    return Result<void>::ok();
}

void DirectRelay::stop() {
    if (!running_) return;
    running_ = false;
    stopping_ = true;

    if (socket_) {
        socket_->close();
    }
    qCInfo(lanbridgeDirectLog) << "Direct relay stopping," << inflight_ << "queries in flight";

    if (inflight_ == 0) {
        stopping_ = false;
        emit stopped();
    }
}

uint16_t DirectRelay::listenPort() const {
    return socket_ ? socket_->localPort() : 0;
}

void DirectRelay::onDatagrams() {
    while (socket_ && socket_->hasPendingDatagrams()) {
        const auto pending = socket_->pendingDatagramSize();
        QByteArray datagram;
        datagram.resize(static_cast<int>(std::clamp<qint64>(pending, 0, config_.udp_buffer_size)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto n = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (n < 0) {
            qCWarning(lanbridgeDirectLog) << "Error reading from listen socket:" << socket_->errorString();
            continue;
        }
        datagram.truncate(static_cast<int>(n));
        forward(datagram, sender, sender_port);
    }
}

void DirectRelay::forward(const QByteArray& datagram, const QHostAddress& sender,
                          quint16 sender_port) {
    qCDebug(lanbridgeDirectLog) << "Query of" << datagram.size() << "bytes from"
                                << sender.toString() << sender_port;

    auto* query = new DiscoveryQuery(
        DiscoveryQuery::Options{
            .target = device_,
            .port = config_.effective_device_port(),
            .timeout = config_.reply_timeout,
            .buffer_size = config_.udp_buffer_size,
            .max_replies = 1,
        },
        this);

    connect(query, &DiscoveryQuery::replyReceived, this,
            [this, sender, sender_port](const QByteArray& reply, const QHostAddress&, quint16) {
                if (!socket_ || !running_) return;
                if (socket_->writeDatagram(reply, sender, sender_port) < 0) {
                    qCWarning(lanbridgeDirectLog) << "Cannot send reply to" << sender.toString()
                                                  << sender_port << ":" << socket_->errorString();
                    return;
                }
                qCDebug(lanbridgeDirectLog) << "Reply of" << reply.size() << "bytes to"
                                            << sender.toString() << sender_port;
            });
    connect(query, &DiscoveryQuery::finished, this, [this, query](int) {
        query->deleteLater();
        queryFinished();
    });

    auto started = query->start(datagram);
    if (started.is_err()) {
        qCWarning(lanbridgeDirectLog) << "Query failed:" << started.unwrap_err().message.c_str();
        query->deleteLater();
        return;
    }
    ++inflight_;
}

void DirectRelay::queryFinished() {
    --inflight_;
    if (stopping_ && inflight_ == 0) {
        stopping_ = false;
        emit stopped();
    }
}

} // namespace lanbridge::network
