#include "core/command_line.hpp"

#include <utility>

namespace lanbridge::core {
namespace {

Result<Role> usage_error(std::string message) {
    return Result<Role>::err(Error{std::move(message), ErrorCode::ConfigInvalid});
}

} // namespace

Result<Role> apply_command_line(Config& config, const QStringList& positional, bool direct) {
    if (positional.isEmpty()) {
        return usage_error("missing command");
    }

    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    if (command == QStringLiteral("app")) {
        if (direct) {
            return usage_error("--direct only applies to 'client'");
        }
        if (args.size() > 2) {
            return usage_error("too many arguments for 'app'");
        }
        if (args.size() > 0) {
            config.app.bind_address = args.at(0);
        }
        if (args.size() > 1) {
            config.app.direct_device_address = args.at(1);
        }
        return Result<Role>::ok(Role::App);
    }

    if (command == QStringLiteral("client")) {
        if (args.size() > 1) {
            return usage_error("too many arguments for 'client'");
        }

        if (direct || config.client.direct_mode) {
            config.client.direct_mode = true;
            if (!args.isEmpty()) {
                config.client.direct_device_address = args.at(0);
            }
            if (config.client.direct_device_address.isEmpty()) {
                return usage_error("'client' in direct mode needs the device address");
            }
            return Result<Role>::ok(Role::Client);
        }

        if (!args.isEmpty()) {
            config.client.remote_host = args.at(0);
        }
        if (config.client.remote_host.isEmpty()) {
            return usage_error("'client' needs the app-side relay host");
        }
        return Result<Role>::ok(Role::Client);
    }

    return usage_error("unknown command '" + command.toStdString() + "'");
}

} // namespace lanbridge::core
