#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanbridgeMainLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeCodecLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeTunnelLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeAppLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeClientLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeDirectLog)
Q_DECLARE_LOGGING_CATEGORY(lanbridgeQueryLog)

namespace lanbridge::core {

struct LoggingOptions {
    bool debug = false;
    // Appended to in addition to stderr when non-empty.
    QString file_path;
};

// Installs a Qt message handler that stamps time/level/category on every line
// and writes it to stderr (and the optional log file). Debug output for the
// lanbridge.* categories is enabled when `debug` is set or LANBRIDGE_DEBUG is
// present in the environment.
void install_logging(const LoggingOptions& options);

// Applies only the category filter rules; used by tests that keep Qt's
// default handler.
void set_debug_logging(bool enabled);

} // namespace lanbridge::core
