#include "core/lifecycle.hpp"
#include "core/logging.hpp"

#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace lanbridge::core {
namespace {

int g_signal_fds[2] = {-1, -1};

void on_posix_signal(int signo) {
    const auto saved_errno = errno;
    const auto byte = static_cast<char>(signo);
    (void)::write(g_signal_fds[0], &byte, 1);
    errno = saved_errno;
}

} // namespace

ShutdownNotifier::ShutdownNotifier(QObject* parent)
    : QObject(parent)
{
}

ShutdownNotifier::~ShutdownNotifier() {
    if (!installed_) return;

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    notifier_.reset();
    ::close(g_signal_fds[0]);
    ::close(g_signal_fds[1]);
    g_signal_fds[0] = g_signal_fds[1] = -1;
}

Result<void> ShutdownNotifier::install() {
    if (installed_) {
        return Result<void>::ok();
    }
    if (g_signal_fds[0] >= 0) {
        return Result<void>::err(Error{"a shutdown notifier is already installed"});
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signal_fds) != 0) {
        return Result<void>::err(Error{std::string("socketpair() failed: ") + std::strerror(errno)});
    }

    notifier_ = std::make_unique<QSocketNotifier>(g_signal_fds[1], QSocketNotifier::Read, this);
    connect(notifier_.get(), &QSocketNotifier::activated,
            this, &ShutdownNotifier::onSignalPipeReadable);

    struct sigaction action {};
    action.sa_handler = on_posix_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &action, nullptr) != 0 ||
        ::sigaction(SIGTERM, &action, nullptr) != 0) {
        const std::string reason = std::strerror(errno);
        notifier_.reset();
        ::close(g_signal_fds[0]);
        ::close(g_signal_fds[1]);
        g_signal_fds[0] = g_signal_fds[1] = -1;
        return Result<void>::err(Error{"sigaction() failed: " + reason});
    }

    installed_ = true;
    return Result<void>::ok();
}

void ShutdownNotifier::onSignalPipeReadable() {
    notifier_->setEnabled(false);
    char byte = 0;
    if (::read(g_signal_fds[1], &byte, 1) != 1) {
        qCWarning(lanbridgeMainLog) << "Failed to read signal pipe:" << std::strerror(errno);
    }
    notifier_->setEnabled(true);

    qCInfo(lanbridgeMainLog) << "Shutdown signal received:" << static_cast<int>(byte);
    emit shutdownRequested(static_cast<int>(byte));
}

} // namespace lanbridge::core
