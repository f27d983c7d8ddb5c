#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <QStringList>

namespace lanbridge::core {

enum class Role {
    App,
    Client
};

/**
 * Apply the positional command line to `config` and return the chosen role.
 *
 * - `app [bind_address] [device_address]`: a device address selects direct
 *   mode.
 * - `client [host]`: in tunnel mode `host` is the app-side relay. With
 *   `direct` set, or `client.direct_mode` in the config, `host` is the device
 *   itself and overrides `client.direct_device_address`.
 *
 * Arguments that are not given keep the configured value. A missing command,
 * an unknown one, surplus arguments or a client without a target fail with
 * ConfigInvalid.
 */
Result<Role> apply_command_line(Config& config, const QStringList& positional, bool direct);

} // namespace lanbridge::core
