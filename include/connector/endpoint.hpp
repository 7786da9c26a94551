#pragma once

#include <string>

namespace knxbridge::connector {

constexpr const char *kKnxScheme = "knx";
constexpr const char *kMqttScheme = "mqtt";

/**
 * @brief Parsed link endpoint, `scheme://path`.
 *
 * `knx://1/0/7` addresses a group address, `mqtt://knx/lights/state` a broker
 * topic (or topic filter for inbound links).
 */
struct Endpoint {
    std::string scheme;
    std::string path;

    std::string url() const { return scheme + "://" + path; }
};

// Splits `scheme://path`. Fails on a missing separator, empty scheme or empty path.
// A valid knx group address is rewritten in canonical form (`01/0/07` -> `1/0/7`).
bool parse_endpoint(const std::string &url, Endpoint &out);

// MQTT filter matching with `+` (one level) and `#` (remaining levels).
bool topic_matches(const std::string &filter, const std::string &topic);
bool is_valid_topic_filter(const std::string &filter);
bool is_valid_publish_topic(const std::string &topic);

// Lowercases each level and folds separators to `_`. Wildcard levels are kept.
std::string sanitize_topic_path(const std::string &raw);

} // namespace knxbridge::connector
