#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "core/command_line.hpp"
#include "core/config.hpp"
#include "core/lifecycle.hpp"
#include "core/logging.hpp"
#include "network/app_relay.hpp"
#include "network/client_relay.hpp"

#include <memory>

namespace {

int usage(const QCommandLineParser& parser, const QString& message) {
    QTextStream err(stderr);
    err << message << "\n\n" << parser.helpText();
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanbridge");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Relays HDHomeRun-style UDP discovery between two networks over a TCP tunnel."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Load settings from a JSON config file."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("d"), QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also enabled by LANBRIDGE_DEBUG)."));
    parser.addOption(debugOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log lines to this file as well as stderr."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption templateOption(
        QStringList{QStringLiteral("template")},
        QStringLiteral("Write an example config file and exit."));
    parser.addOption(templateOption);

    const QCommandLineOption directOption(
        QStringList{QStringLiteral("direct")},
        QStringLiteral("client: <host> is the device itself, relay without a tunnel."));
    parser.addOption(directOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'app [bind] [device]' or 'client <host>'."));
    parser.process(app);

    const auto positional = parser.positionalArguments();

    if (parser.isSet(templateOption)) {
        const QString path = positional.value(0, QStringLiteral("lanbridge.json"));
        auto saved = lanbridge::core::save_config_template(path);
        if (saved.is_err()) {
            QTextStream(stderr) << "Cannot write template: "
                                << QString::fromStdString(saved.unwrap_err().message) << "\n";
            return 1;
        }
        QTextStream(stdout) << "Wrote " << path << "\n";
        return 0;
    }

    auto loaded = lanbridge::core::load_config(parser.value(configOption));
    if (loaded.is_err()) {
        QTextStream(stderr) << "Invalid config: "
                            << QString::fromStdString(loaded.unwrap_err().message) << "\n";
        return 1;
    }
    lanbridge::core::Config config = std::move(loaded).unwrap();

    if (parser.isSet(debugOption)) {
        config.debug = true;
    }
    if (parser.isSet(logFileOption)) {
        config.log_file = parser.value(logFileOption);
    }

    auto role = lanbridge::core::apply_command_line(config, positional, parser.isSet(directOption));
    if (role.is_err()) {
        return usage(parser, QString::fromStdString(role.unwrap_err().message));
    }

    std::unique_ptr<lanbridge::network::Relay> relay;
    if (role.unwrap() == lanbridge::core::Role::App) {
        relay = std::make_unique<lanbridge::network::AppRelay>(config);
    } else {
        relay = std::make_unique<lanbridge::network::ClientRelay>(config);
    }

    lanbridge::core::install_logging(lanbridge::core::LoggingOptions{
        .debug = config.debug,
        .file_path = config.log_file,
    });

    lanbridge::core::ShutdownNotifier shutdown;
    auto installed = shutdown.install();
    if (installed.is_err()) {
        qCWarning(lanbridgeMainLog) << "Signal handling unavailable:"
                                    << installed.unwrap_err().message.c_str();
    }

    QObject::connect(&shutdown, &lanbridge::core::ShutdownNotifier::shutdownRequested,
                     relay.get(), [&relay](int signal_number) {
                         qCInfo(lanbridgeMainLog) << "Received signal" << signal_number
                                                  << ", shutting down";
                         relay->stop();
                     });
    QObject::connect(relay.get(), &lanbridge::network::Relay::stopped, &app, &QCoreApplication::quit);
    QObject::connect(relay.get(), &lanbridge::network::Relay::fatal, &app,
                     [&app](const lanbridge::Error& error) {
                         qCCritical(lanbridgeMainLog) << "Fatal:" << lanbridge::to_string(error.code)
                                                      << error.message.c_str();
                         app.exit(1);
                     });

    auto started = relay->start();
    if (started.is_err()) {
        const auto& error = started.unwrap_err();
        qCCritical(lanbridgeMainLog) << "Cannot start:" << lanbridge::to_string(error.code)
                                     << error.message.c_str();
        return 1;
    }

    return app.exec();
}
