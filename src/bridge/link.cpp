#include "bridge/link.hpp"

#include <algorithm>
#include <cctype>

namespace knxbridge::bridge {
namespace {

std::string lowercase(const std::string &value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

} // namespace

BindingError make_delivery_options(const LinkConfig &config, connector::DeliveryOptions &out) {
    connector::DeliveryOptions options;
    for (const auto &item : config) {
        const std::string key = lowercase(item.first);
        if (key == "qos") {
            if (item.second != "0" && item.second != "1" && item.second != "2") {
                return BindingError::InvalidOption;
            }
            options.qos = static_cast<uint8_t>(item.second[0] - '0');
        } else if (key == "retain") {
            const std::string value = lowercase(item.second);
            if (value == "true" || value == "1") {
                options.retain = true;
            } else if (value == "false" || value == "0") {
                options.retain = false;
            } else {
                return BindingError::InvalidOption;
            }
        } else {
            options.extra[item.first] = item.second;
        }
    }
    out = std::move(options);
    return BindingError::None;
}

BindingError binding_error_from(connector::Status status) {
    switch (status) {
        case connector::Status::Ok:
            return BindingError::None;
        case connector::Status::Unavailable:
            return BindingError::ConnectorUnavailable;
        case connector::Status::Rejected:
            return BindingError::InvalidEndpoint;
        case connector::Status::Failed:
        default:
            return BindingError::EndpointRejected;
    }
}

} // namespace knxbridge::bridge
