#include <catch2/catch_test_macros.hpp>
#include "network/envelope.hpp"

using namespace lanbridge;
using namespace lanbridge::network;

TEST_CASE("Envelope: wire layout is address, port, payload", "[envelope]") {
    auto envelope = make_envelope(QHostAddress(QStringLiteral("192.168.1.42")), 54321,
                                  QByteArray("QUERY"));
    REQUIRE(envelope.is_ok());

    const auto bytes = encode_envelope(envelope.unwrap());
    REQUIRE(bytes == QByteArray("\xC0\xA8\x01\x2A\xD4\x31QUERY", 11));

    auto decoded = decode_envelope(bytes);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == envelope.unwrap());
    REQUIRE(decoded.unwrap().origin_address() == QHostAddress(QStringLiteral("192.168.1.42")));
    REQUIRE(decoded.unwrap().origin_string() == QStringLiteral("192.168.1.42:54321"));
}

TEST_CASE("Envelope: header-only envelope has an empty payload", "[envelope]") {
    auto decoded = decode_envelope(QByteArray("\x0A\x00\x00\x01\x00\x50", 6));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().origin_address() == QHostAddress(QStringLiteral("10.0.0.1")));
    REQUIRE(decoded.unwrap().origin_port == 80);
    REQUIRE(decoded.unwrap().payload.isEmpty());
}

TEST_CASE("Envelope: fewer than six bytes is malformed", "[envelope]") {
    for (int size = 0; size < 6; ++size) {
        auto decoded = decode_envelope(QByteArray(size, '\x01'));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::MalformedEnvelope);
    }
}

TEST_CASE("Envelope: IPv6 origins are rejected", "[envelope]") {
    auto envelope = make_envelope(QHostAddress(QStringLiteral("fe80::1")), 1234, QByteArray("x"));
    REQUIRE(envelope.is_err());
    REQUIRE(envelope.unwrap_err().code == ErrorCode::NotIpv4);
}

TEST_CASE("Envelope: IPv4-mapped IPv6 origins are accepted", "[envelope]") {
    auto envelope = make_envelope(QHostAddress(QStringLiteral("::ffff:10.1.2.3")), 5000,
                                  QByteArray("x"));
    REQUIRE(envelope.is_ok());
    REQUIRE(envelope.unwrap().origin_address() == QHostAddress(QStringLiteral("10.1.2.3")));
}
