#include "core/config.hpp"
#include "core/logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QtGlobal>

#include <optional>

namespace lanbridge::core {
namespace {

std::optional<int> positive_int(const QJsonObject& obj, const char* key) {
    const auto value = obj.value(QLatin1String(key));
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const int v = value.toInt();
    if (v <= 0) {
        return std::nullopt;
    }
    return v;
}

std::optional<uint16_t> port_value(const QJsonObject& obj, const char* key) {
    auto v = positive_int(obj, key);
    if (!v || *v > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*v);
}

void read_string(const QJsonObject& obj, const char* key, QString& out) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isString()) {
        out = value.toString().trimmed();
    }
}

void read_bool(const QJsonObject& obj, const char* key, bool& out) {
    const auto value = obj.value(QLatin1String(key));
    if (value.isBool()) {
        out = value.toBool();
    }
}

} // namespace

QString default_capture_address() {
#ifdef Q_OS_WIN
    return QStringLiteral("0.0.0.0");
#else
    return QStringLiteral("255.255.255.255");
#endif
}

Result<Config> config_from_json(const QJsonObject& obj, const Config& base) {
    Config cfg = base;

    if (auto v = port_value(obj, "discovery_port")) cfg.discovery_port = *v;
    if (auto v = port_value(obj, "tunnel_port")) cfg.tunnel_port = *v;
    if (auto v = port_value(obj, "device_port")) cfg.device_port = *v;
    if (auto v = positive_int(obj, "udp_read_timeout_ms")) {
        cfg.reply_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = positive_int(obj, "udp_read_buffer_size")) cfg.udp_buffer_size = *v;
    if (auto v = positive_int(obj, "reconnect_interval_seconds")) {
        cfg.reconnect_interval = std::chrono::seconds(*v);
    }

    const auto inflight = obj.value(QStringLiteral("max_inflight_queries"));
    if (inflight.isDouble()) {
        if (inflight.toInt() < 0) {
            return Result<Config>::err(
                Error{"max_inflight_queries must not be negative", ErrorCode::ConfigInvalid});
        }
        cfg.max_inflight_queries = inflight.toInt();
    }

    read_bool(obj, "debug", cfg.debug);
    read_string(obj, "log_file", cfg.log_file);

    const auto app = obj.value(QStringLiteral("app"));
    if (app.isObject()) {
        const auto a = app.toObject();
        read_string(a, "bind_address", cfg.app.bind_address);
        read_string(a, "broadcast_address", cfg.app.broadcast_address);
        read_string(a, "direct_device_address", cfg.app.direct_device_address);
    } else if (!app.isUndefined()) {
        return Result<Config>::err(Error{"\"app\" must be an object", ErrorCode::ConfigInvalid});
    }

    const auto client = obj.value(QStringLiteral("client"));
    if (client.isObject()) {
        const auto c = client.toObject();
        read_string(c, "remote_host", cfg.client.remote_host);
        read_bool(c, "direct_mode", cfg.client.direct_mode);
        read_string(c, "direct_device_address", cfg.client.direct_device_address);
        read_string(c, "capture_address", cfg.client.capture_address);
    } else if (!client.isUndefined()) {
        return Result<Config>::err(Error{"\"client\" must be an object", ErrorCode::ConfigInvalid});
    }

    return Result<Config>::ok(std::move(cfg));
}

QJsonObject config_to_json(const Config& config) {
    QJsonObject app;
    app["bind_address"] = config.app.bind_address;
    app["broadcast_address"] = config.app.broadcast_address;
    app["direct_device_address"] = config.app.direct_device_address;

    QJsonObject client;
    client["remote_host"] = config.client.remote_host;
    client["direct_mode"] = config.client.direct_mode;
    client["direct_device_address"] = config.client.direct_device_address;
    client["capture_address"] = config.client.capture_address;

    QJsonObject obj;
    obj["discovery_port"] = static_cast<int>(config.discovery_port);
    obj["tunnel_port"] = static_cast<int>(config.tunnel_port);
    obj["device_port"] = static_cast<int>(config.device_port);
    obj["udp_read_timeout_ms"] = static_cast<int>(config.reply_timeout.count());
    obj["udp_read_buffer_size"] = config.udp_buffer_size;
    obj["reconnect_interval_seconds"] = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(config.reconnect_interval).count());
    obj["max_inflight_queries"] = config.max_inflight_queries;
    obj["debug"] = config.debug;
    obj["log_file"] = config.log_file;
    obj["app"] = app;
    obj["client"] = client;
    return obj;
}

Result<Config> load_config(const QString& path) {
    if (path.isEmpty()) {
        return Result<Config>::ok(Config{});
    }

    QFile file(path);
    if (!file.exists()) {
        qCInfo(lanbridgeMainLog) << "Config file not found, using defaults:" << path;
        return Result<Config>::ok(Config{});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<Config>::err(Error{
            "failed to read config file " + path.toStdString() + ": " +
                file.errorString().toStdString(),
            ErrorCode::ConfigInvalid});
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<Config>::err(Error{
            "failed to parse config file " + path.toStdString() + ": " +
                err.errorString().toStdString(),
            ErrorCode::ConfigInvalid});
    }

    auto cfg = config_from_json(doc.object());
    if (cfg.is_ok()) {
        qCInfo(lanbridgeMainLog) << "Config loaded:" << QFileInfo(path).absoluteFilePath();
    }
    return cfg;
}

Result<void> save_config_template(const QString& path) {
    Config tmpl;
    tmpl.app.direct_device_address = QStringLiteral("192.168.1.50");
    tmpl.client.remote_host = QStringLiteral("10.10.10.9");
    tmpl.client.direct_device_address = QStringLiteral("10.10.10.50");

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Result<void>::err(Error{
            "failed to write template config " + path.toStdString() + ": " +
                file.errorString().toStdString(),
            ErrorCode::ConfigInvalid});
    }

    const auto bytes = QJsonDocument(config_to_json(tmpl)).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        return Result<void>::err(Error{
            "failed to write template config " + path.toStdString(), ErrorCode::ConfigInvalid});
    }
    return Result<void>::ok();
}

} // namespace lanbridge::core
