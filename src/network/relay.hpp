#pragma once

#include "core/result.hpp"

#include <QObject>

namespace lanbridge::network {

/**
 * Relay - Common lifecycle of the app-side, client-side and direct relays.
 *
 * start() fails when a socket cannot be bound; that is fatal at startup.
 * Unrecoverable errors found later are reported through `fatal`. After
 * stop(), `stopped` is emitted once every in-flight exchange has drained.
 */
class Relay : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~Relay() override = default;

    virtual Result<void> start() = 0;
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;

signals:
    void fatal(const lanbridge::Error& error);
    void stopped();
};

} // namespace lanbridge::network
