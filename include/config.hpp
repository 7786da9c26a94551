#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "logger.hpp"

namespace knxbridge {

enum class Profile : uint8_t {
    Gateway,
    Console,
};

struct KnxConfig {
    std::string gateway_host = "192.168.1.19";
    uint16_t gateway_port = 3671;
};

struct MqttConfig {
    std::string broker_uri = "mqtt://192.168.1.7:1883";
    uint16_t port = 1883;
    std::string client_id = "knx-gateway-001";
    uint8_t default_qos = 1;
    bool retain = false;
};

struct EndpointConfig {
    std::string lights_state_address = "1/0/7";
    std::string lights_control_address = "1/0/6";
    std::string temperature_address = "9/1/0";
    std::string lights_state_topic = "knx/lights/state";
    std::string lights_control_topic = "knx/lights/control";
    std::string temperature_topic = "knx/temperature/state";
};

struct BufferConfig {
    size_t ring_capacity = 50;
    size_t max_subscribers = 8;
};

struct BridgeConfig {
    Profile profile = Profile::Gateway;
    KnxConfig knx;
    MqttConfig mqtt;
    EndpointConfig endpoints;
    BufferConfig buffers;
    log::Level log_level = log::Level::Info;
    uint32_t diagnostic_period_ms = 0;
    size_t arena_bytes = 64 * 1024;
};

// Parses a JSON document over `out`. Absent keys keep their current value;
// out-of-range values fall back to defaults with a warning. Returns false
// (leaving `out` untouched) when the text is not a JSON object.
bool parse_bridge_config(const std::string &json, BridgeConfig &out);

// Reads `path` and parses it. A missing or unreadable file returns false.
bool load_bridge_config(const std::string &path, BridgeConfig &out);

// MQTT_BROKER overrides mqtt.broker_uri.
void apply_environment(BridgeConfig &cfg);

void log_bridge_config(const BridgeConfig &cfg);

const char *to_string(Profile profile);
bool profile_from_string(const std::string &value, Profile &out);

} // namespace knxbridge
