#pragma once

#include "core/result.hpp"

#include <QObject>
#include <memory>

class QSocketNotifier;

namespace lanbridge::core {

/**
 * ShutdownNotifier - Delivers SIGINT/SIGTERM as a Qt signal.
 *
 * The POSIX handler only writes a byte to a socket pair; the read end is
 * watched by a QSocketNotifier so `shutdownRequested` is emitted from the
 * event loop, where it is safe to touch sockets and timers.
 * Only one instance may be installed per process.
 */
class ShutdownNotifier : public QObject {
    Q_OBJECT

public:
    explicit ShutdownNotifier(QObject* parent = nullptr);
    ~ShutdownNotifier() override;

    Result<void> install();

signals:
    void shutdownRequested(int signal_number);

private slots:
    void onSignalPipeReadable();

private:
    std::unique_ptr<QSocketNotifier> notifier_;
    bool installed_ = false;
};

} // namespace lanbridge::core
