#include "offline_sync/subscription.hpp"

#include <utility>

namespace offline_sync {

Subscription::Subscription(std::function<void()> detach)
    : detach_(std::move(detach)) {}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : detach_(std::exchange(other.detach_, nullptr)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        detach_ = std::exchange(other.detach_, nullptr);
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (!detach_) {
        return;
    }
    auto detach = std::exchange(detach_, nullptr);
    detach();
}

bool Subscription::active() const noexcept {
    return static_cast<bool>(detach_);
}

}  // namespace offline_sync
