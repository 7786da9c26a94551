#include "bridge/bridge.hpp"

#include <chrono>
#include <system_error>

namespace knxbridge::bridge {
namespace {
constexpr const char *TAG = "bridge";
} // namespace

namespace detail {

std::shared_ptr<connector::Connector> Runtime::connector_for(const std::string &scheme) const {
    auto it = connectors.find(scheme);
    if (it == connectors.end()) {
        return nullptr;
    }
    return it->second;
}

void Runtime::shutdown() {
    inbound.clear();
    store.close_all();
    for (auto &worker : outbound) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    outbound.clear();
    for (auto &monitor : monitors) {
        monitor->join();
    }
    for (auto &conn : started) {
        conn->stop();
    }
    started.clear();
}

} // namespace detail

Bridge::Bridge(std::unique_ptr<detail::Runtime> runtime,
               std::set<std::type_index> inbound_types,
               uint32_t diagnostics_period_ms)
    : runtime_(std::move(runtime)),
      inbound_types_(std::move(inbound_types)),
      diagnostics_period_ms_(diagnostics_period_ms),
      running_(true) {}

Bridge::~Bridge() {
    stop();
}

void Bridge::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    KNXB_LOGI(TAG, "Stopping bridge");
    {
        std::lock_guard<std::mutex> lock(diag_mutex_);
    }
    diag_cv_.notify_all();
    if (diag_thread_.joinable()) {
        diag_thread_.join();
    }
    runtime_->shutdown();
}

diagnostics::BridgeHealthSnapshot Bridge::health_snapshot() const {
    diagnostics::BridgeHealthSnapshot snap{};
    snap.links.reserve(runtime_->links.size());
    for (const auto &link : runtime_->links) {
        snap.links.push_back(diagnostics::snapshot(*link));
    }
    snap.cells = runtime_->store.snapshot();
    snap.monitors_running = monitors_running();
    return snap;
}

size_t Bridge::monitors_running() const {
    size_t count = 0;
    for (const auto &monitor : runtime_->monitors) {
        if (monitor->running()) {
            ++count;
        }
    }
    return count;
}

void Bridge::start_diagnostics() {
    if (diagnostics_period_ms_ == 0) {
        return;
    }
    try {
        diag_thread_ = std::thread(&Bridge::diagnostic_task, this);
    } catch (const std::system_error &e) {
        KNXB_LOGW(TAG, "Diagnostics task not started: %s", e.what());
    }
}

void Bridge::diagnostic_task() {
    const auto period = std::chrono::milliseconds(diagnostics_period_ms_);
    std::unique_lock<std::mutex> lock(diag_mutex_);
    while (!diag_cv_.wait_for(lock, period, [this]() { return !running_.load(); })) {
        lock.unlock();
        diagnostics::log_snapshot(health_snapshot(), "bridge-diag");
        lock.lock();
    }
}

BridgeBuilder &BridgeBuilder::with_connector(std::shared_ptr<connector::Connector> connector) {
    if (connector) {
        connectors_.push_back(std::move(connector));
    }
    return *this;
}

BridgeBuilder &BridgeBuilder::with_memory_resource(std::pmr::memory_resource *resource) {
    resource_ = resource;
    return *this;
}

BridgeBuilder &BridgeBuilder::with_diagnostics_period(uint32_t period_ms) {
    diagnostics_period_ms_ = period_ms;
    return *this;
}

BindingError BridgeBuilder::build(std::unique_ptr<Bridge> &out) {
    auto runtime = std::make_unique<detail::Runtime>(resource_);

    for (const auto &conn : connectors_) {
        if (!runtime->connectors.emplace(conn->scheme(), conn).second) {
            KNXB_LOGW(TAG, "Second connector for scheme '%s' ignored", conn->scheme().c_str());
        }
    }

    std::set<std::type_index> seen;
    std::set<std::type_index> inbound_types;
    for (const auto &record : records_) {
        if (!seen.insert(record->type()).second) {
            KNXB_LOGE(TAG, "Record %s configured twice", record->name().c_str());
            return BindingError::DuplicateRecord;
        }
        BindingError err = record->validate(*runtime);
        if (err != BindingError::None) {
            KNXB_LOGE(TAG, "Record %s rejected: %s", record->name().c_str(), to_string(err));
            return err;
        }
        if (record->has_inbound()) {
            inbound_types.insert(record->type());
        }
    }

    for (const auto &item : runtime->connectors) {
        connector::Status status = item.second->start();
        if (status != connector::Status::Ok) {
            KNXB_LOGE(TAG, "Connector '%s' failed to start: %s", item.first.c_str(),
                      connector::to_string(status));
            runtime->shutdown();
            return BindingError::ConnectorUnavailable;
        }
        runtime->started.push_back(item.second);
    }

    for (const auto &record : records_) {
        BindingError err = record->create_cell(*runtime);
        if (err != BindingError::None) {
            KNXB_LOGE(TAG, "Cell for %s not created: %s", record->name().c_str(), to_string(err));
            runtime->shutdown();
            return err;
        }
    }

    for (const auto &record : records_) {
        BindingError err = record->bind_outbound(*runtime);
        if (err != BindingError::None) {
            KNXB_LOGE(TAG, "Outbound links for %s not bound: %s", record->name().c_str(),
                      to_string(err));
            runtime->shutdown();
            return err;
        }
    }

    for (const auto &record : records_) {
        record->attach_monitors(*runtime);
    }

    for (const auto &record : records_) {
        BindingError err = record->bind_inbound(*runtime);
        if (err != BindingError::None) {
            KNXB_LOGE(TAG, "Inbound links for %s not bound: %s", record->name().c_str(),
                      to_string(err));
            runtime->shutdown();
            return err;
        }
    }

    KNXB_LOGI(TAG, "Bridge assembled: %zu records, %zu links, %zu monitors", records_.size(),
              runtime->links.size(), runtime->monitors.size());

    out.reset(new Bridge(std::move(runtime), std::move(inbound_types), diagnostics_period_ms_));
    out->start_diagnostics();
    return BindingError::None;
}

} // namespace knxbridge::bridge
