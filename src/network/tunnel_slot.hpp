#pragma once

#include <QMutex>
#include <memory>

namespace lanbridge::network {

class TunnelLink;

/**
 * TunnelSlot - The single tunnel link a relay currently writes to.
 *
 * Readers take a shared reference and do their I/O outside the lock, so one
 * slow transfer never serializes the others. The mutex only guards reading
 * or swapping the reference.
 */
class TunnelSlot {
public:
    TunnelSlot() = default;
    TunnelSlot(const TunnelSlot&) = delete;
    TunnelSlot& operator=(const TunnelSlot&) = delete;

    [[nodiscard]] std::shared_ptr<TunnelLink> current() const;

    [[nodiscard]] bool has_link() const;

    /**
     * Hold `link` from now on and return the previously held link, which is
     * left untouched (last connection wins).
     */
    std::shared_ptr<TunnelLink> replace(std::shared_ptr<TunnelLink> link);

    /**
     * Release the held link, if any, and return it.
     */
    std::shared_ptr<TunnelLink> take();

    /**
     * Release the held link only if it is still `link`.
     * Returns false when another link has replaced it in the meantime.
     */
    bool clear_if(const TunnelLink* link);

private:
    mutable QMutex mu_;
    std::shared_ptr<TunnelLink> link_;
};

} // namespace lanbridge::network
