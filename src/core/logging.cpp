#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lanbridgeMainLog, "lanbridge.main", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeCodecLog, "lanbridge.codec", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeTunnelLog, "lanbridge.tunnel", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeAppLog, "lanbridge.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeClientLog, "lanbridge.client", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeDirectLog, "lanbridge.direct", QtInfoMsg)
Q_LOGGING_CATEGORY(lanbridgeQueryLog, "lanbridge.query", QtInfoMsg)

namespace lanbridge::core {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg: return "FATAL";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s, const QString& path) {
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "lanbridge: cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString();

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

void set_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
        ? QStringLiteral("lanbridge.*.debug=true\n")
        : QStringLiteral("lanbridge.*.debug=false\n"));
}

void install_logging(const LoggingOptions& options) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        open_log_file(s, options.file_path);
    }

    set_debug_logging(options.debug || qEnvironmentVariableIsSet("LANBRIDGE_DEBUG"));
    qInstallMessageHandler(message_handler);
}

} // namespace lanbridge::core
