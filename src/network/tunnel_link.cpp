#include "network/tunnel_link.hpp"
#include "core/logging.hpp"

#include <QHostAddress>
#include <QMetaObject>
#include <QTcpSocket>

namespace lanbridge::network {
namespace {

ErrorCode classify(QAbstractSocket::SocketError error, TunnelLink::State state) {
    if (error == QAbstractSocket::HostNotFoundError) {
        return ErrorCode::HostNotFound;
    }
    return state == TunnelLink::State::Connecting ? ErrorCode::ConnectFailed
                                                  : ErrorCode::TunnelReadFailed;
}

} // namespace

TunnelLink::TunnelLink(QTcpSocket* accepted, QObject* parent)
    : QObject(parent)
{
    accepted->setParent(this);
    socket_.reset(accepted);
    attachSocket();

    peer_name_ = QStringLiteral("%1:%2")
                     .arg(socket_->peerAddress().toString())
                     .arg(socket_->peerPort());
    state_ = socket_->state() == QAbstractSocket::ConnectedState ? State::Connected
                                                                 : State::Closed;

    if (state_ == State::Connected && socket_->bytesAvailable() > 0) {
        QMetaObject::invokeMethod(this, &TunnelLink::onReadyRead, Qt::QueuedConnection);
    }
}

TunnelLink::TunnelLink(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QTcpSocket>(this))
{
    attachSocket();
}

TunnelLink::~TunnelLink() {
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
    }
}

std::shared_ptr<TunnelLink> TunnelLink::create(QTcpSocket* accepted) {
    return std::shared_ptr<TunnelLink>(new TunnelLink(accepted), [](TunnelLink* link) {
        link->deleteLater();
    });
}

std::shared_ptr<TunnelLink> TunnelLink::create() {
    return std::shared_ptr<TunnelLink>(new TunnelLink(), [](TunnelLink* link) {
        link->deleteLater();
    });
}

void TunnelLink::attachSocket() {
    connect(socket_.get(), &QTcpSocket::connected,
            this, &TunnelLink::onSocketConnected);
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &TunnelLink::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &TunnelLink::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &TunnelLink::onReadyRead);
}

void TunnelLink::dial(const QString& host, uint16_t port) {
    if (state_ != State::Idle) {
        qCWarning(lanbridgeTunnelLog) << "dial() on a link that was already used";
        return;
    }

    peer_name_ = QStringLiteral("%1:%2").arg(host).arg(port);
    state_ = State::Connecting;
    socket_->connectToHost(host, port);
}

Result<void> TunnelLink::send_frame(const QByteArray& payload) {
    if (state_ != State::Connected) {
        return Result<void>::err(Error{"tunnel link is not connected",
                                       ErrorCode::TunnelWriteFailed});
    }

    auto frame = MessageCodec::encode(payload);
    if (frame.is_err()) {
        return Result<void>::err(frame.unwrap_err());
    }

    const auto& bytes = frame.unwrap();
    const auto written = socket_->write(bytes);
    if (written != bytes.size()) {
        const auto reason = socket_->errorString().toStdString();
        return Result<void>::err(Error{"tunnel write failed: " + reason,
                                       ErrorCode::TunnelWriteFailed});
    }
    socket_->flush();

    return Result<void>::ok();
}

void TunnelLink::abort() {
    close(Error{});
}

QString TunnelLink::peerName() const {
    return peer_name_;
}

void TunnelLink::close(const Error& cause) {
    if (state_ == State::Closed) {
        return;
    }
    state_ = State::Closed;

    socket_->abort();
    codec_.reset();

    if (cause.code != ErrorCode::Unknown) {
        emit failed(cause);
    }
    emit closed();
}

void TunnelLink::onSocketConnected() {
    if (state_ != State::Connecting) return;

    peer_name_ = QStringLiteral("%1:%2")
                     .arg(socket_->peerAddress().toString())
                     .arg(socket_->peerPort());
    state_ = State::Connected;
    emit connected();
}

void TunnelLink::onSocketDisconnected() {
    close(Error{"peer closed the tunnel", ErrorCode::TunnelReadFailed});
}

void TunnelLink::onSocketError(QAbstractSocket::SocketError error) {
    close(Error{socket_->errorString().toStdString(), classify(error, state_)});
}

void TunnelLink::onReadyRead() {
    const auto chunk = socket_->readAll();
    if (chunk.isEmpty()) return;

    qCDebug(lanbridgeTunnelLog) << "Read" << chunk.size() << "bytes from" << peer_name_;
    codec_.decode(chunk, [this](const QByteArray& payload) {
        // A handler may have aborted the link; drop the rest of the chunk.
        if (state_ != State::Connected) return;
        emit frameReceived(payload);
    });
}

} // namespace lanbridge::network
