#pragma once

#include <functional>

namespace knxbridge::connector {

/**
 * @brief Move-only handle on a connector receive registration. Destroying or
 * resetting it removes the callback.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel);
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void reset();
    bool active() const { return cancel_ != nullptr; }

private:
    std::function<void()> cancel_{};
};

} // namespace knxbridge::connector
