#pragma once

#include "core/result.hpp"

#include <QJsonObject>
#include <QString>
#include <chrono>
#include <cstdint>

namespace lanbridge::core {

constexpr uint16_t kDefaultDiscoveryPort = 65001;
constexpr uint16_t kDefaultTunnelPort = kDefaultDiscoveryPort;
constexpr std::chrono::milliseconds kDefaultReplyTimeout{500};
constexpr int kDefaultUdpBufferSize = 4096;
constexpr std::chrono::seconds kDefaultReconnectInterval{3};

/**
 * Address a broadcast capture socket binds to on this platform.
 *
 * Sockets bound to the limited broadcast address only see broadcasts on
 * Linux and macOS; Windows does not deliver them there, so it binds the
 * wildcard address instead.
 */
QString default_capture_address();

struct AppSideConfig {
    QString bind_address = QStringLiteral("0.0.0.0");
    QString broadcast_address = QStringLiteral("255.255.255.255");
    // Non-empty selects direct mode.
    QString direct_device_address;
};

struct ClientSideConfig {
    QString remote_host;
    bool direct_mode = false;
    QString direct_device_address;
    QString capture_address = default_capture_address();
};

/**
 * Config - Startup parameters for both relay roles.
 *
 * Every field has a usable default so a relay can run without a config file.
 */
struct Config {
    uint16_t discovery_port = kDefaultDiscoveryPort;
    uint16_t tunnel_port = kDefaultTunnelPort;
    // Port the real device answers on; 0 means the discovery port.
    uint16_t device_port = 0;
    std::chrono::milliseconds reply_timeout = kDefaultReplyTimeout;
    int udp_buffer_size = kDefaultUdpBufferSize;
    std::chrono::milliseconds reconnect_interval = kDefaultReconnectInterval;
    // 0 means no ceiling on concurrent discovery queries.
    int max_inflight_queries = 0;

    bool debug = false;
    QString log_file;

    AppSideConfig app;
    ClientSideConfig client;

    [[nodiscard]] uint16_t effective_device_port() const {
        return device_port != 0 ? device_port : discovery_port;
    }
};

/**
 * Overlay the keys present in `obj` onto `base`.
 * Non-positive numbers and out of range ports keep the value from `base`.
 */
Result<Config> config_from_json(const QJsonObject& obj, const Config& base = Config{});

QJsonObject config_to_json(const Config& config);

/**
 * Load a JSON config file.
 * An empty path or a missing file yields the defaults.
 */
Result<Config> load_config(const QString& path);

/**
 * Write an example config file with every key populated.
 */
Result<void> save_config_template(const QString& path);

} // namespace lanbridge::core
