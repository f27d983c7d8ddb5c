#include <catch2/catch_test_macros.hpp>

#include "network/client_relay.hpp"
#include "network/envelope.hpp"
#include "support/fakes.hpp"
#include "support/spin.hpp"

#include <QElapsedTimer>
#include <QTcpServer>
#include <QTcpSocket>

#include <memory>
#include <optional>

using namespace lanbridge;
using namespace lanbridge::network;
using lanbridge::test::FakeApplication;
using lanbridge::test::TunnelPeer;
using lanbridge::test::spinFor;
using lanbridge::test::spinUntil;

namespace {

// Plays the app-side relay: accepts tunnels and records what they carry.
struct FakeAppSide {
    QTcpServer server;
    std::vector<std::unique_ptr<TunnelPeer>> peers;

    FakeAppSide() {
        server.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&server, &QTcpServer::newConnection, [this]() {
            while (auto* socket = server.nextPendingConnection()) {
                peers.push_back(std::make_unique<TunnelPeer>(socket));
            }
        });
    }

    [[nodiscard]] TunnelPeer& latest() { return *peers.back(); }
};

core::Config clientConfig(quint16 tunnel_port, std::chrono::milliseconds interval) {
    core::Config config;
    config.discovery_port = 0;
    config.tunnel_port = tunnel_port;
    config.reconnect_interval = interval;
    config.client.remote_host = QStringLiteral("127.0.0.1");
    config.client.capture_address = QStringLiteral("127.0.0.1");
    return config;
}

} // namespace

TEST_CASE("ClientRelay: connects within a few reconnect ticks", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(50)));

    std::vector<ClientRelay::State> states;
    QObject::connect(&relay, &ClientRelay::stateChanged,
                     [&states](ClientRelay::State state) { states.push_back(state); });

    REQUIRE(relay.start().is_ok());
    REQUIRE(relay.state() == ClientRelay::State::Disconnected);
    REQUIRE(relay.capturePort() != 0);

    REQUIRE(spinUntil([&]() { return relay.state() == ClientRelay::State::Connected; }, 2000));
    REQUIRE(spinUntil([&]() { return app_side.peers.size() == 1; }, 2000));
    REQUIRE(states.size() == 2);
    REQUIRE(states[0] == ClientRelay::State::Connecting);
    REQUIRE(states[1] == ClientRelay::State::Connected);
}

TEST_CASE("ClientRelay: wraps captured datagrams and delivers replies", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(50)));
    REQUIRE(relay.start().is_ok());
    REQUIRE(spinUntil([&]() {
        return relay.state() == ClientRelay::State::Connected && !app_side.peers.empty();
    }, 2000));

    FakeApplication app;
    app.send(QByteArray("QUERY"), relay.capturePort());

    auto& tunnel = app_side.latest();
    REQUIRE(spinUntil([&]() { return !tunnel.envelopes().empty(); }, 2000));
    const auto request = tunnel.envelopes().front();
    REQUIRE(request.origin_address() == QHostAddress(QHostAddress::LocalHost));
    REQUIRE(request.origin_port == app.port());
    REQUIRE(request.payload == QByteArray("QUERY"));

    tunnel.send(Envelope{
        .origin_ipv4 = request.origin_ipv4,
        .origin_port = request.origin_port,
        .payload = QByteArray("REPLY"),
    });
    REQUIRE(spinUntil([&]() { return !app.replies().isEmpty(); }, 2000));
    REQUIRE(app.replies().front() == QByteArray("REPLY"));
}

TEST_CASE("ClientRelay: datagrams captured while disconnected are discarded", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(300)));
    REQUIRE(relay.start().is_ok());

    FakeApplication app;
    app.send(QByteArray("EARLY"), relay.capturePort());
    spinFor(50);
    REQUIRE(relay.state() == ClientRelay::State::Disconnected);

    REQUIRE(spinUntil([&]() {
        return relay.state() == ClientRelay::State::Connected && !app_side.peers.empty();
    }, 3000));
    spinFor(100);
    REQUIRE(app_side.latest().frames() == 0);

    app.send(QByteArray("LATE"), relay.capturePort());
    REQUIRE(spinUntil([&]() { return !app_side.latest().envelopes().empty(); }, 2000));
    REQUIRE(app_side.latest().envelopes().size() == 1);
    REQUIRE(app_side.latest().envelopes().front().payload == QByteArray("LATE"));
}

TEST_CASE("ClientRelay: malformed tunnel frames are ignored", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(50)));
    REQUIRE(relay.start().is_ok());
    REQUIRE(spinUntil([&]() { return !app_side.peers.empty(); }, 2000));
    REQUIRE(spinUntil([&]() { return relay.state() == ClientRelay::State::Connected; }, 2000));

    FakeApplication app;
    auto& tunnel = app_side.latest();
    tunnel.sendRaw(QByteArray("\x7F", 1));
    tunnel.send(make_envelope(QHostAddress(QHostAddress::LocalHost), app.port(),
                              QByteArray("OK")).unwrap());

    REQUIRE(spinUntil([&]() { return !app.replies().isEmpty(); }, 2000));
    REQUIRE(app.replies().front() == QByteArray("OK"));
    REQUIRE(relay.state() == ClientRelay::State::Connected);
}

TEST_CASE("ClientRelay: redials after the tunnel drops", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(50)));
    REQUIRE(relay.start().is_ok());
    REQUIRE(spinUntil([&]() {
        return relay.state() == ClientRelay::State::Connected && app_side.peers.size() == 1;
    }, 2000));

    app_side.latest().socket()->abort();
    REQUIRE(spinUntil([&]() { return relay.state() != ClientRelay::State::Connected; }, 2000));
    REQUIRE(spinUntil([&]() {
        return relay.state() == ClientRelay::State::Connected && app_side.peers.size() == 2;
    }, 2000));
}

TEST_CASE("ClientRelay: keeps retrying while the app side is down", "[integration][client]") {
    QTcpServer reserved;
    REQUIRE(reserved.listen(QHostAddress::LocalHost, 0));
    const auto port = reserved.serverPort();
    reserved.close();

    ClientRelay relay(clientConfig(port, std::chrono::milliseconds(50)));
    bool fatal = false;
    QObject::connect(&relay, &Relay::fatal, [&fatal](const Error&) { fatal = true; });
    REQUIRE(relay.start().is_ok());

    spinFor(400);
    REQUIRE_FALSE(fatal);
    REQUIRE(relay.isRunning());
    REQUIRE(relay.state() != ClientRelay::State::Connected);
}

TEST_CASE("ClientRelay: connects on the first tick after the app side comes up", "[integration][client]") {
    constexpr int kIntervalMs = 100;
    constexpr int kDownTicks = 3;
    constexpr int kMarginMs = 200;

    QTcpServer app_side;
    REQUIRE(app_side.listen(QHostAddress::LocalHost, 0));
    const auto port = app_side.serverPort();
    app_side.close();

    ClientRelay relay(clientConfig(port, std::chrono::milliseconds(kIntervalMs)));
    QElapsedTimer since_start;
    since_start.start();
    REQUIRE(relay.start().is_ok());

    spinFor(kDownTicks * kIntervalMs);
    REQUIRE(relay.state() != ClientRelay::State::Connected);
    REQUIRE(app_side.listen(QHostAddress::LocalHost, port));

    REQUIRE(spinUntil([&]() { return relay.state() == ClientRelay::State::Connected; },
                      kIntervalMs + kMarginMs));
    REQUIRE(since_start.elapsed() <= (kDownTicks + 1) * kIntervalMs + kMarginMs);
}

TEST_CASE("ClientRelay: unresolvable host is fatal", "[integration][client]") {
    auto config = clientConfig(65001, std::chrono::milliseconds(50));
    config.client.remote_host = QStringLiteral("nonexistent.invalid");
    ClientRelay relay(config);

    std::optional<Error> fatal;
    QObject::connect(&relay, &Relay::fatal, [&fatal](const Error& error) { fatal = error; });
    REQUIRE(relay.start().is_ok());

    REQUIRE(spinUntil([&]() { return fatal.has_value(); }, 10000));
    REQUIRE(fatal->code == ErrorCode::HostNotFound);
}

TEST_CASE("ClientRelay: start needs a remote host", "[integration][client]") {
    auto config = clientConfig(65001, std::chrono::milliseconds(50));
    config.client.remote_host.clear();
    ClientRelay relay(config);

    auto started = relay.start();
    REQUIRE(started.is_err());
    REQUIRE(started.unwrap_err().code == ErrorCode::ConfigInvalid);
}

TEST_CASE("ClientRelay: stop closes the tunnel and emits stopped", "[integration][client]") {
    FakeAppSide app_side;
    ClientRelay relay(clientConfig(app_side.server.serverPort(), std::chrono::milliseconds(50)));
    REQUIRE(relay.start().is_ok());
    REQUIRE(spinUntil([&]() {
        return relay.state() == ClientRelay::State::Connected && !app_side.peers.empty();
    }, 2000));

    bool stopped = false;
    QObject::connect(&relay, &Relay::stopped, [&stopped]() { stopped = true; });
    relay.stop();
    REQUIRE(stopped);
    REQUIRE(relay.state() == ClientRelay::State::Disconnected);

    auto* socket = app_side.latest().socket();
    REQUIRE(spinUntil([&]() { return socket->state() == QAbstractSocket::UnconnectedState; }, 2000));
}
