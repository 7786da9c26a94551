#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "connector/connector.hpp"

namespace knxbridge::connector {

struct SentMessage {
    std::string path;
    codec::Bytes payload;
    DeliveryOptions options;
};

/**
 * @brief In-memory connector. Stands in for a KNX/IP tunnel or MQTT client on
 * the host: inject() plays the role of the transport's receive context and
 * every send() is recorded.
 */
class LoopbackConnector : public Connector {
public:
    using SendHook = std::function<void(const SentMessage &)>;

    explicit LoopbackConnector(std::string scheme);
    ~LoopbackConnector() override;

    const std::string &scheme() const override { return scheme_; }

    Status start() override;
    void stop() override;
    bool running() const override;

    Status send(const std::string &path,
                const codec::Bytes &payload,
                const DeliveryOptions &options) override;

    Status on_receive(const std::string &path, ReceiveCallback callback, Subscription &out) override;

    // Delivers `payload` on the caller's thread to every matching registration.
    // Returns the number of callbacks invoked (0 when stopped).
    size_t inject(const std::string &path, const codec::Bytes &payload);

    std::vector<SentMessage> sent() const;
    std::vector<SentMessage> sent_to(const std::string &path) const;
    bool wait_for_sent(size_t count, std::chrono::milliseconds timeout) const;
    void clear_sent();

    void set_available(bool available);
    void fail_sends_to(const std::string &path, bool fail = true);
    void set_send_hook(SendHook hook);

    size_t receiver_count() const;
    uint32_t failed_sends() const;

private:
    struct Receiver {
        std::string filter;
        ReceiveCallback callback;
    };

    bool matches(const std::string &filter, const std::string &path) const;

    std::string scheme_;
    mutable std::mutex mutex_;
    mutable std::condition_variable sent_cv_;
    bool running_ = false;
    bool available_ = true;
    std::vector<std::shared_ptr<Receiver>> receivers_;
    std::vector<SentMessage> sent_;
    std::set<std::string> failing_paths_;
    SendHook send_hook_;
    uint32_t failed_sends_ = 0;
};

} // namespace knxbridge::connector
