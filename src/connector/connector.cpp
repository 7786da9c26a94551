#include "connector/connector.hpp"

#include "codec/group_address.hpp"
#include "connector/endpoint.hpp"

namespace knxbridge::connector {

Status Connector::validate(const std::string &path, Direction direction) const {
    return validate_path(scheme(), path, direction);
}

Status validate_path(const std::string &scheme, const std::string &path, Direction direction) {
    if (scheme == kKnxScheme) {
        return codec::is_valid_group_address(path) ? Status::Ok : Status::Rejected;
    }
    if (scheme == kMqttScheme) {
        const bool valid = direction == Direction::Inbound ? is_valid_topic_filter(path)
                                                           : is_valid_publish_topic(path);
        return valid ? Status::Ok : Status::Rejected;
    }
    return path.empty() ? Status::Rejected : Status::Ok;
}

const char *to_string(Status status) {
    switch (status) {
        case Status::Ok:
            return "ok";
        case Status::Unavailable:
            return "unavailable";
        case Status::Rejected:
            return "rejected";
        case Status::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

const char *to_string(Direction direction) {
    return direction == Direction::Inbound ? "inbound" : "outbound";
}

} // namespace knxbridge::connector
