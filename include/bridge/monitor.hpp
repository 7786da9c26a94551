#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "errors.hpp"
#include "logger.hpp"
#include "store/record_store.hpp"

namespace knxbridge::bridge {

template <typename T>
using MonitorFn = std::function<void(const T &)>;

/**
 * @brief Running monitor. Owns its thread; the thread ends once the watched
 * cell is closed.
 */
class MonitorHandle {
public:
    MonitorHandle(std::string name, std::shared_ptr<std::atomic<bool>> running, std::thread thread);
    ~MonitorHandle();

    MonitorHandle(const MonitorHandle &) = delete;
    MonitorHandle &operator=(const MonitorHandle &) = delete;

    const std::string &name() const { return name_; }
    bool running() const { return running_->load(); }

    // Caller must close the cell first or this blocks until it is closed.
    void join();

private:
    std::string name_;
    std::shared_ptr<std::atomic<bool>> running_;
    std::thread thread_;
};

/**
 * @brief Subscribes to the cell of T and runs `fn` on every observed value.
 * Fails without starting a thread when there is no cell or no free subscriber
 * slot.
 */
template <typename T>
SubscriptionError attach_monitor(store::RecordStore &store,
                                 const std::string &name,
                                 MonitorFn<T> fn,
                                 std::unique_ptr<MonitorHandle> &out) {
    std::unique_ptr<store::BufferReader<T>> reader;
    SubscriptionError err = store.subscribe<T>(reader);
    if (err != SubscriptionError::None) {
        return err;
    }

    auto running = std::make_shared<std::atomic<bool>>(true);
    std::thread worker([reader = std::move(reader), fn = std::move(fn), running, name]() {
        T value{};
        SubscriptionError sub_err;
        while ((sub_err = reader->next(value)) == SubscriptionError::None) {
            fn(value);
        }
        KNXB_LOGD("monitor", "%s exiting: %s", name.c_str(), to_string(sub_err));
        running->store(false);
    });
    out = std::make_unique<MonitorHandle>(name, running, std::move(worker));
    return SubscriptionError::None;
}

// Monitor body that formats each value and logs it at info level under `tag`.
template <typename T>
MonitorFn<T> logging_monitor(std::string tag, std::function<std::string(const T &)> format) {
    return [tag = std::move(tag), format = std::move(format)](const T &value) {
        const std::string line = format(value);
        KNXB_LOGI(tag.c_str(), "%s", line.c_str());
    };
}

} // namespace knxbridge::bridge
