#include "connector/subscription.hpp"

#include <utility>

namespace knxbridge::connector {

Subscription::Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

Subscription::Subscription(Subscription &&other) noexcept : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        reset();
        cancel_ = std::move(other.cancel_);
        other.cancel_ = nullptr;
    }
    return *this;
}

Subscription::~Subscription() {
    reset();
}

void Subscription::reset() {
    if (cancel_) {
        auto cancel = std::move(cancel_);
        cancel_ = nullptr;
        cancel();
    }
}

} // namespace knxbridge::connector
