#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bridge/link.hpp"
#include "bridge/monitor.hpp"
#include "store/buffer_cfg.hpp"

namespace knxbridge::bridge {

template <typename T>
struct TapSpec {
    std::string name;
    MonitorFn<T> fn;
};

/**
 * @brief Everything declared for one record type before assembly.
 */
template <typename T>
struct RecordSpec {
    std::string name;
    std::optional<store::BufferCfg> buffer;
    std::vector<InboundLinkSpec<T>> inbound;
    std::vector<OutboundLinkSpec<T>> outbound;
    std::vector<TapSpec<T>> taps;
};

template <typename T>
class RecordRegistrar;

template <typename T>
class InboundLinkBuilder {
public:
    InboundLinkBuilder(RecordRegistrar<T> &owner, std::string url)
        : owner_(owner) {
        link_.url = std::move(url);
    }

    InboundLinkBuilder &with_deserializer(Deserializer<T> deserializer) {
        link_.deserializer = std::move(deserializer);
        return *this;
    }

    InboundLinkBuilder &with_config(const std::string &key, const std::string &value) {
        link_.config[key] = value;
        return *this;
    }

    RecordRegistrar<T> &finish();

private:
    RecordRegistrar<T> &owner_;
    InboundLinkSpec<T> link_;
};

template <typename T>
class OutboundLinkBuilder {
public:
    OutboundLinkBuilder(RecordRegistrar<T> &owner, std::string url)
        : owner_(owner) {
        link_.url = std::move(url);
    }

    OutboundLinkBuilder &with_serializer(Serializer<T> serializer) {
        link_.serializer = std::move(serializer);
        return *this;
    }

    OutboundLinkBuilder &with_config(const std::string &key, const std::string &value) {
        link_.config[key] = value;
        return *this;
    }

    RecordRegistrar<T> &finish();

private:
    RecordRegistrar<T> &owner_;
    OutboundLinkSpec<T> link_;
};

/**
 * @brief Fluent declaration of one record type: buffer, links and taps.
 *
 * Nothing is validated here; BridgeBuilder::build() checks the whole
 * declaration and reports the first problem as a BindingError.
 */
template <typename T>
class RecordRegistrar {
public:
    explicit RecordRegistrar(RecordSpec<T> &spec) : spec_(spec) {}

    RecordRegistrar &name(std::string value) {
        spec_.name = std::move(value);
        return *this;
    }

    RecordRegistrar &buffer(const store::BufferCfg &cfg) {
        spec_.buffer = cfg;
        return *this;
    }

    RecordRegistrar &tap(std::string tap_name, MonitorFn<T> fn) {
        spec_.taps.push_back(TapSpec<T>{std::move(tap_name), std::move(fn)});
        return *this;
    }

    InboundLinkBuilder<T> link_from(std::string url) {
        return InboundLinkBuilder<T>(*this, std::move(url));
    }

    OutboundLinkBuilder<T> link_to(std::string url) {
        return OutboundLinkBuilder<T>(*this, std::move(url));
    }

private:
    friend class InboundLinkBuilder<T>;
    friend class OutboundLinkBuilder<T>;

    RecordSpec<T> &spec_;
};

template <typename T>
RecordRegistrar<T> &InboundLinkBuilder<T>::finish() {
    owner_.spec_.inbound.push_back(std::move(link_));
    return owner_;
}

template <typename T>
RecordRegistrar<T> &OutboundLinkBuilder<T>::finish() {
    owner_.spec_.outbound.push_back(std::move(link_));
    return owner_;
}

} // namespace knxbridge::bridge
