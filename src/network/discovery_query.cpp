#include "network/discovery_query.hpp"
#include "core/logging.hpp"

#include <QTimer>
#include <QUdpSocket>

#include <algorithm>

namespace lanbridge::network {

DiscoveryQuery::DiscoveryQuery(Options options, QObject* parent)
    : QObject(parent)
    , options_(std::move(options))
    , socket_(std::make_unique<QUdpSocket>(this))
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setSingleShot(true);
    timer_->setInterval(options_.timeout);

    connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryQuery::onReadyRead);
    connect(timer_.get(), &QTimer::timeout, this, &DiscoveryQuery::onTimeout);
}

DiscoveryQuery::~DiscoveryQuery() = default;

Result<void> DiscoveryQuery::start(const QByteArray& payload) {
    if (!socket_->bind(QHostAddress::AnyIPv4, 0)) {
        return Result<void>::err(Error{
            "cannot bind query socket: " + socket_->errorString().toStdString(),
            ErrorCode::QueryFailed});
    }

    const auto sent = socket_->writeDatagram(payload, options_.target, options_.port);
    if (sent < 0) {
        return Result<void>::err(Error{
            "cannot send query to " + options_.target.toString().toStdString() + ": " +
                socket_->errorString().toStdString(),
            ErrorCode::QueryFailed});
    }

    timer_->start();
    return Result<void>::ok();
}

void DiscoveryQuery::onReadyRead() {
    while (!done_ && socket_->hasPendingDatagrams()) {
        const auto pending = socket_->pendingDatagramSize();
        QByteArray datagram;
        datagram.resize(static_cast<int>(std::clamp<qint64>(pending, 0, options_.buffer_size)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto n = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (n < 0) {
            qCWarning(lanbridgeQueryLog) << "Error reading discovery reply:" << socket_->errorString();
            continue;
        }
        datagram.truncate(static_cast<int>(n));
        if (datagram.isEmpty()) {
            continue;
        }

        ++reply_count_;
        emit replyReceived(datagram, sender, sender_port);

        if (options_.max_replies > 0 && reply_count_ >= options_.max_replies) {
            finish();
        }
    }
}

void DiscoveryQuery::onTimeout() {
    if (reply_count_ == 0) {
        qCDebug(lanbridgeQueryLog) << "No reply from" << options_.target.toString()
                                   << "within" << options_.timeout.count() << "ms";
    }
    finish();
}

void DiscoveryQuery::finish() {
    if (done_) return;
    done_ = true;

    timer_->stop();
    socket_->close();
    emit finished(reply_count_);
}

} // namespace lanbridge::network
