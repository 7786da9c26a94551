#pragma once

#include <system_error>
#include <typeinfo>
#include <utility>

#include "connector/endpoint.hpp"
#include "logger.hpp"

namespace knxbridge::bridge {

namespace detail {

template <typename T>
BindingError RecordSlot<T>::validate(const Runtime &runtime) const {
    if (!spec.buffer) {
        return BindingError::MissingBuffer;
    }
    if (!spec.buffer->valid()) {
        return BindingError::InvalidBuffer;
    }
    if (spec.inbound.size() > 1) {
        return BindingError::DuplicateInbound;
    }

    auto check = [&runtime](const std::string &url, const LinkConfig &config,
                            connector::Direction direction) {
        connector::Endpoint endpoint;
        if (!connector::parse_endpoint(url, endpoint)) {
            return BindingError::InvalidEndpoint;
        }
        auto target = runtime.connector_for(endpoint.scheme);
        if (!target) {
            return BindingError::UnknownScheme;
        }
        connector::DeliveryOptions options;
        BindingError err = make_delivery_options(config, options);
        if (err != BindingError::None) {
            return err;
        }
        return binding_error_from(target->validate(endpoint.path, direction));
    };

    for (const auto &link : spec.inbound) {
        if (!link.deserializer) {
            return BindingError::MissingCodec;
        }
        BindingError err = check(link.url, link.config, connector::Direction::Inbound);
        if (err != BindingError::None) {
            return err;
        }
    }
    for (const auto &link : spec.outbound) {
        if (!link.serializer) {
            return BindingError::MissingCodec;
        }
        BindingError err = check(link.url, link.config, connector::Direction::Outbound);
        if (err != BindingError::None) {
            return err;
        }
    }
    return BindingError::None;
}

template <typename T>
BindingError RecordSlot<T>::create_cell(Runtime &runtime) {
    return runtime.store.create_cell<T>(*spec.buffer, spec.name);
}

template <typename T>
BindingError RecordSlot<T>::bind_inbound(Runtime &runtime) {
    auto cell = runtime.store.cell<T>();
    if (!cell) {
        return BindingError::MissingBuffer;
    }

    for (const auto &link : spec.inbound) {
        connector::Endpoint endpoint;
        if (!connector::parse_endpoint(link.url, endpoint)) {
            return BindingError::InvalidEndpoint;
        }
        auto target = runtime.connector_for(endpoint.scheme);
        if (!target) {
            return BindingError::UnknownScheme;
        }

        auto health = std::make_shared<diagnostics::LinkHealth>();
        diagnostics::init(*health, spec.name, link.url, true);

        connector::Subscription subscription;
        connector::Status status = target->on_receive(
            endpoint.path, make_inbound_handler<T>(cell, link.deserializer, health), subscription);
        if (status != connector::Status::Ok) {
            KNXB_LOGE("bridge", "Inbound link %s for %s refused: %s", link.url.c_str(),
                      spec.name.c_str(), connector::to_string(status));
            return binding_error_from(status);
        }
        runtime.inbound.push_back(std::move(subscription));
        runtime.links.push_back(health);
        KNXB_LOGI("bridge", "%s <- %s", spec.name.c_str(), link.url.c_str());
    }
    return BindingError::None;
}

template <typename T>
BindingError RecordSlot<T>::bind_outbound(Runtime &runtime) {
    auto cell = runtime.store.cell<T>();
    if (!cell) {
        return BindingError::MissingBuffer;
    }

    for (const auto &link : spec.outbound) {
        connector::Endpoint endpoint;
        if (!connector::parse_endpoint(link.url, endpoint)) {
            return BindingError::InvalidEndpoint;
        }
        auto target = runtime.connector_for(endpoint.scheme);
        if (!target) {
            return BindingError::UnknownScheme;
        }

        connector::DeliveryOptions options;
        BindingError err = make_delivery_options(link.config, options);
        if (err != BindingError::None) {
            return err;
        }

        std::unique_ptr<store::BufferReader<T>> reader;
        SubscriptionError sub_err = cell->subscribe(reader);
        if (sub_err == SubscriptionError::SubscriberLimit) {
            KNXB_LOGE("bridge", "Outbound link %s for %s: subscriber limit reached",
                      link.url.c_str(), spec.name.c_str());
            return BindingError::SubscriberLimit;
        }
        if (sub_err != SubscriptionError::None) {
            return BindingError::MissingBuffer;
        }

        auto health = std::make_shared<diagnostics::LinkHealth>();
        diagnostics::init(*health, spec.name, link.url, false);

        try {
            runtime.outbound.emplace_back(&run_outbound_link<T>, std::move(reader), target,
                                          endpoint.path, link.serializer, options, health);
        } catch (const std::system_error &e) {
            KNXB_LOGE("bridge", "Failed to start outbound link %s: %s", link.url.c_str(), e.what());
            return BindingError::OutOfMemory;
        }
        runtime.links.push_back(health);
        KNXB_LOGI("bridge", "%s -> %s (qos=%u retain=%s)", spec.name.c_str(), link.url.c_str(),
                  static_cast<unsigned>(options.qos), options.retain ? "true" : "false");
    }
    return BindingError::None;
}

template <typename T>
void RecordSlot<T>::attach_monitors(Runtime &runtime) {
    for (const auto &tap : spec.taps) {
        std::unique_ptr<MonitorHandle> handle;
        SubscriptionError err = SubscriptionError::None;
        try {
            err = attach_monitor<T>(runtime.store, tap.name, tap.fn, handle);
        } catch (const std::system_error &e) {
            KNXB_LOGE("bridge", "Monitor %s for %s not started: %s", tap.name.c_str(),
                      spec.name.c_str(), e.what());
            continue;
        }
        if (err != SubscriptionError::None) {
            KNXB_LOGE("bridge", "Monitor %s for %s not attached: %s", tap.name.c_str(),
                      spec.name.c_str(), to_string(err));
            continue;
        }
        runtime.monitors.push_back(std::move(handle));
    }
}

} // namespace detail

template <typename T>
SubscriptionError Bridge::subscribe(std::unique_ptr<store::BufferReader<T>> &out) {
    return runtime_->store.subscribe<T>(out);
}

template <typename T>
SubscriptionError Bridge::get(T &out) const {
    return runtime_->store.get<T>(out);
}

template <typename T>
SubscriptionError Bridge::try_get(T &out) const {
    auto cell = runtime_->store.cell<T>();
    if (!cell) {
        return SubscriptionError::CellNotFound;
    }
    return cell->try_get(out);
}

template <typename T>
bool Bridge::write(T value) {
    if (inbound_types_.count(std::type_index(typeid(T))) != 0) {
        KNXB_LOGW("bridge", "Refusing local write to a record fed by an inbound link");
        return false;
    }
    return runtime_->store.write<T>(std::move(value));
}

template <typename T, typename Fn>
BridgeBuilder &BridgeBuilder::configure(Fn &&fn) {
    auto slot = std::make_unique<detail::RecordSlot<T>>();
    RecordRegistrar<T> registrar(slot->spec);
    fn(registrar);
    if (slot->spec.name.empty()) {
        slot->spec.name = typeid(T).name();
    }
    records_.push_back(std::move(slot));
    return *this;
}

} // namespace knxbridge::bridge
