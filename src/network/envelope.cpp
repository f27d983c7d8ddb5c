#include "network/envelope.hpp"

namespace lanbridge::network {

QString Envelope::origin_string() const {
    return QStringLiteral("%1:%2").arg(origin_address().toString()).arg(origin_port);
}

Result<Envelope> make_envelope(const QHostAddress& origin, uint16_t port,
                               const QByteArray& payload) {
    bool is_ipv4 = false;
    const quint32 ipv4 = origin.toIPv4Address(&is_ipv4);
    if (!is_ipv4) {
        return Result<Envelope>::err(Error{
            "origin " + origin.toString().toStdString() + " is not an IPv4 address",
            ErrorCode::NotIpv4});
    }

    Envelope envelope;
    envelope.origin_ipv4 = ipv4;
    envelope.origin_port = port;
    envelope.payload = payload;
    return Result<Envelope>::ok(std::move(envelope));
}

QByteArray encode_envelope(const Envelope& envelope) {
    QByteArray data;
    data.reserve(static_cast<int>(Envelope::kHeaderSize) + envelope.payload.size());

    data.append(static_cast<char>((envelope.origin_ipv4 >> 24) & 0xFF));
    data.append(static_cast<char>((envelope.origin_ipv4 >> 16) & 0xFF));
    data.append(static_cast<char>((envelope.origin_ipv4 >> 8) & 0xFF));
    data.append(static_cast<char>(envelope.origin_ipv4 & 0xFF));
    data.append(static_cast<char>((envelope.origin_port >> 8) & 0xFF));
    data.append(static_cast<char>(envelope.origin_port & 0xFF));
    data.append(envelope.payload);

    return data;
}

Result<Envelope> decode_envelope(const QByteArray& bytes) {
    if (static_cast<size_t>(bytes.size()) < Envelope::kHeaderSize) {
        return Result<Envelope>::err(Error{
            "envelope too short: " + std::to_string(bytes.size()) + " bytes",
            ErrorCode::MalformedEnvelope});
    }

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.constData());

    Envelope envelope;
    envelope.origin_ipv4 = (static_cast<uint32_t>(data[0]) << 24) |
                           (static_cast<uint32_t>(data[1]) << 16) |
                           (static_cast<uint32_t>(data[2]) << 8) |
                           static_cast<uint32_t>(data[3]);
    envelope.origin_port = static_cast<uint16_t>((static_cast<uint16_t>(data[4]) << 8) |
                                                 static_cast<uint16_t>(data[5]));
    envelope.payload = bytes.mid(static_cast<int>(Envelope::kHeaderSize));

    return Result<Envelope>::ok(std::move(envelope));
}

} // namespace lanbridge::network
