#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <typeindex>
#include <vector>

#include "bridge/link.hpp"
#include "bridge/monitor.hpp"
#include "bridge/record_registrar.hpp"
#include "connector/connector.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "store/record_store.hpp"

namespace knxbridge::bridge {

namespace detail {

/**
 * @brief Everything a running bridge owns. Filled phase by phase during
 * assembly and torn down in reverse by shutdown().
 */
struct Runtime {
    explicit Runtime(std::pmr::memory_resource *resource) : store(resource) {}
    ~Runtime() { shutdown(); }

    std::shared_ptr<connector::Connector> connector_for(const std::string &scheme) const;
    void shutdown();

    store::RecordStore store;
    std::map<std::string, std::shared_ptr<connector::Connector>> connectors;
    std::vector<std::shared_ptr<connector::Connector>> started;
    std::vector<connector::Subscription> inbound;
    std::vector<std::thread> outbound;
    std::vector<std::shared_ptr<diagnostics::LinkHealth>> links;
    std::vector<std::unique_ptr<MonitorHandle>> monitors;
};

class RecordSlotBase {
public:
    virtual ~RecordSlotBase() = default;

    virtual std::type_index type() const = 0;
    virtual const std::string &name() const = 0;
    virtual bool has_inbound() const = 0;

    virtual BindingError validate(const Runtime &runtime) const = 0;
    virtual BindingError create_cell(Runtime &runtime) = 0;
    virtual BindingError bind_outbound(Runtime &runtime) = 0;
    virtual void attach_monitors(Runtime &runtime) = 0;
    virtual BindingError bind_inbound(Runtime &runtime) = 0;
};

template <typename T>
class RecordSlot final : public RecordSlotBase {
public:
    std::type_index type() const override { return std::type_index(typeid(T)); }
    const std::string &name() const override { return spec.name; }
    bool has_inbound() const override { return !spec.inbound.empty(); }

    BindingError validate(const Runtime &runtime) const override;
    BindingError create_cell(Runtime &runtime) override;
    BindingError bind_outbound(Runtime &runtime) override;
    void attach_monitors(Runtime &runtime) override;
    BindingError bind_inbound(Runtime &runtime) override;

    RecordSpec<T> spec;
};

} // namespace detail

/**
 * @brief An assembled, running bridge.
 *
 * Created only by BridgeBuilder::build(). stop() (or destruction) closes
 * every cell, unregisters inbound links, joins outbound and monitor threads
 * and finally stops the connectors.
 */
class Bridge {
public:
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    void stop();
    bool running() const { return running_.load(); }

    template <typename T>
    SubscriptionError subscribe(std::unique_ptr<store::BufferReader<T>> &out);

    template <typename T>
    SubscriptionError get(T &out) const;

    template <typename T>
    SubscriptionError try_get(T &out) const;

    // Local producer for a record without an inbound link. Refused when the
    // record already has its single writer.
    template <typename T>
    bool write(T value);

    diagnostics::BridgeHealthSnapshot health_snapshot() const;
    size_t monitors_running() const;

private:
    friend class BridgeBuilder;

    Bridge(std::unique_ptr<detail::Runtime> runtime,
           std::set<std::type_index> inbound_types,
           uint32_t diagnostics_period_ms);

    void start_diagnostics();
    void diagnostic_task();

    std::unique_ptr<detail::Runtime> runtime_;
    std::set<std::type_index> inbound_types_;
    uint32_t diagnostics_period_ms_;
    std::thread diag_thread_;
    std::mutex diag_mutex_;
    std::condition_variable diag_cv_;
    std::atomic<bool> running_;
};

/**
 * @brief Collects connectors and record declarations, then assembles a
 * bridge all-or-nothing.
 *
 * Assembly order: declarations validated, connectors started, every cell
 * created, every outbound link bound, monitors attached, then inbound links
 * registered. Every reader exists before the first inbound callback can
 * write, so a value delivered on registration (an MQTT retained message)
 * still reaches all outbound links and monitors. A failed phase tears down
 * what was built and returns the BindingError. Monitors fail open: an attach
 * error is logged and assembly continues.
 */
class BridgeBuilder {
public:
    BridgeBuilder() = default;

    BridgeBuilder &with_connector(std::shared_ptr<connector::Connector> connector);
    BridgeBuilder &with_memory_resource(std::pmr::memory_resource *resource);
    BridgeBuilder &with_diagnostics_period(uint32_t period_ms);

    template <typename T, typename Fn>
    BridgeBuilder &configure(Fn &&fn);

    BindingError build(std::unique_ptr<Bridge> &out);

private:
    std::vector<std::shared_ptr<connector::Connector>> connectors_;
    std::vector<std::unique_ptr<detail::RecordSlotBase>> records_;
    std::pmr::memory_resource *resource_ = nullptr;
    uint32_t diagnostics_period_ms_ = 0;
};

} // namespace knxbridge::bridge

#include "bridge/bridge.tpp"
