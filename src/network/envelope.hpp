#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <cstddef>
#include <cstdint>

namespace lanbridge::network {

// Envelope helpers for the tunnel payload.
// Kept free of sockets so both relays and the tests share one definition.

/**
 * Envelope - A discovery datagram tagged with the application that sent it.
 *
 * Format:
 * - Origin IPv4 (4 bytes, network order)
 * - Origin port (2 bytes, big-endian)
 * - Payload (remaining bytes, opaque)
 */
struct Envelope {
    static constexpr size_t kHeaderSize = 6;

    uint32_t origin_ipv4 = 0;
    uint16_t origin_port = 0;
    QByteArray payload;

    [[nodiscard]] QHostAddress origin_address() const { return QHostAddress(origin_ipv4); }
    [[nodiscard]] QString origin_string() const;

    bool operator==(const Envelope& other) const {
        return origin_ipv4 == other.origin_ipv4 &&
               origin_port == other.origin_port &&
               payload == other.payload;
    }
};

/**
 * Build an envelope for a datagram received from `origin:port`.
 * IPv4-mapped IPv6 senders are accepted; any other IPv6 sender fails with
 * NotIpv4 since the wire format only carries four address bytes.
 */
Result<Envelope> make_envelope(const QHostAddress& origin, uint16_t port,
                               const QByteArray& payload);

QByteArray encode_envelope(const Envelope& envelope);

/**
 * Parse a tunnel payload. Fewer than six bytes fails with MalformedEnvelope.
 */
Result<Envelope> decode_envelope(const QByteArray& bytes);

} // namespace lanbridge::network
