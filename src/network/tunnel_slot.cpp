#include "network/tunnel_slot.hpp"
#include "network/tunnel_link.hpp"

#include <QMutexLocker>

#include <utility>

namespace lanbridge::network {

std::shared_ptr<TunnelLink> TunnelSlot::current() const {
    QMutexLocker lock(&mu_);
    return link_;
}

bool TunnelSlot::has_link() const {
    QMutexLocker lock(&mu_);
    return link_ != nullptr;
}

std::shared_ptr<TunnelLink> TunnelSlot::replace(std::shared_ptr<TunnelLink> link) {
    QMutexLocker lock(&mu_);
    std::swap(link_, link);
    return link;
}

std::shared_ptr<TunnelLink> TunnelSlot::take() {
    QMutexLocker lock(&mu_);
    return std::exchange(link_, nullptr);
}

bool TunnelSlot::clear_if(const TunnelLink* link) {
    std::shared_ptr<TunnelLink> released;
    {
        QMutexLocker lock(&mu_);
        if (!link_ || link_.get() != link) {
            return false;
        }
        released = std::move(link_);
        link_.reset();
    }
    // `released` may hold the last reference; let it go outside the lock.
    return true;
}

} // namespace lanbridge::network
