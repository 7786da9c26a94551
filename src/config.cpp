#include "config.hpp"

#include "codec/group_address.hpp"
#include "connector/endpoint.hpp"
#include "json_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace knxbridge {
namespace {
constexpr const char *TAG = "bridge-config";
constexpr uint16_t DEFAULT_MQTT_PORT = 1883;
constexpr uint16_t DEFAULT_KNX_PORT = 3671;
constexpr size_t CONFIG_DOC_CAPACITY = 4096;

uint16_t checked_port(long value, uint16_t fallback, const char *what) {
    if (value < 1 || value > 65535) {
        KNXB_LOGW(TAG, "%s port %ld out of range, defaulting to %u", what, value, fallback);
        return fallback;
    }
    return static_cast<uint16_t>(value);
}

void checked_address(std::string &address, const std::string &fallback, const char *what) {
    if (!codec::is_valid_group_address(address)) {
        KNXB_LOGW(TAG, "%s address '%s' invalid, defaulting to %s", what, address.c_str(),
                  fallback.c_str());
        address = fallback;
    }
}

void checked_topic(std::string &topic, const std::string &fallback, const char *what) {
    std::string sanitized = connector::sanitize_topic_path(topic);
    if (sanitized.empty() || !connector::is_valid_publish_topic(sanitized)) {
        KNXB_LOGW(TAG, "%s topic missing or invalid, defaulting to %s", what, fallback.c_str());
        topic = fallback;
        return;
    }
    topic = sanitized;
}

void load_knx(JsonObjectConst obj, KnxConfig &knx) {
    if (obj.isNull()) {
        return;
    }
    knx.gateway_host = obj["gateway_host"] | obj["host"] | knx.gateway_host.c_str();
    knx.gateway_port = checked_port(obj["gateway_port"] | static_cast<long>(knx.gateway_port),
                                    DEFAULT_KNX_PORT, "KNX gateway");
}

void load_mqtt(JsonObjectConst obj, MqttConfig &mqtt) {
    if (obj.isNull()) {
        return;
    }
    mqtt.broker_uri = obj["broker_uri"] | obj["broker"] | mqtt.broker_uri.c_str();
    mqtt.port = checked_port(obj["port"] | static_cast<long>(mqtt.port), DEFAULT_MQTT_PORT, "MQTT");
    mqtt.client_id = obj["client_id"] | mqtt.client_id.c_str();
    mqtt.retain = obj["retain"] | mqtt.retain;

    int qos = obj["default_qos"] | static_cast<int>(mqtt.default_qos);
    if (qos < 0 || qos > 2) {
        KNXB_LOGW(TAG, "MQTT qos %d out of range, defaulting to 1", qos);
        qos = 1;
    }
    mqtt.default_qos = static_cast<uint8_t>(qos);
}

void load_endpoints(JsonObjectConst obj, EndpointConfig &ep) {
    if (obj.isNull()) {
        return;
    }
    const EndpointConfig defaults;
    ep.lights_state_address = obj["lights_state_address"] | ep.lights_state_address.c_str();
    ep.lights_control_address = obj["lights_control_address"] | ep.lights_control_address.c_str();
    ep.temperature_address = obj["temperature_address"] | ep.temperature_address.c_str();
    ep.lights_state_topic = obj["lights_state_topic"] | ep.lights_state_topic.c_str();
    ep.lights_control_topic = obj["lights_control_topic"] | ep.lights_control_topic.c_str();
    ep.temperature_topic = obj["temperature_topic"] | ep.temperature_topic.c_str();

    checked_address(ep.lights_state_address, defaults.lights_state_address, "Light state");
    checked_address(ep.lights_control_address, defaults.lights_control_address, "Light control");
    checked_address(ep.temperature_address, defaults.temperature_address, "Temperature");
    checked_topic(ep.lights_state_topic, defaults.lights_state_topic, "Light state");
    checked_topic(ep.lights_control_topic, defaults.lights_control_topic, "Light control");
    checked_topic(ep.temperature_topic, defaults.temperature_topic, "Temperature");
}

void load_buffers(JsonObjectConst obj, BufferConfig &buffers) {
    if (obj.isNull()) {
        return;
    }
    const BufferConfig defaults;
    long capacity = obj["ring_capacity"] | static_cast<long>(buffers.ring_capacity);
    if (capacity < 1) {
        KNXB_LOGW(TAG, "Ring capacity %ld invalid, defaulting to %zu", capacity, defaults.ring_capacity);
        capacity = static_cast<long>(defaults.ring_capacity);
    }
    buffers.ring_capacity = static_cast<size_t>(capacity);

    long subscribers = obj["max_subscribers"] | static_cast<long>(buffers.max_subscribers);
    if (subscribers < 1) {
        KNXB_LOGW(TAG, "Subscriber limit %ld invalid, defaulting to %zu", subscribers,
                  defaults.max_subscribers);
        subscribers = static_cast<long>(defaults.max_subscribers);
    }
    buffers.max_subscribers = static_cast<size_t>(subscribers);
}

} // namespace

bool parse_bridge_config(const std::string &json, BridgeConfig &out) {
    DynamicJsonDocument doc(CONFIG_DOC_CAPACITY);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        KNXB_LOGE(TAG, "JSON parse error: %s", error.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        KNXB_LOGE(TAG, "Configuration root must be an object");
        return false;
    }

    BridgeConfig cfg = out;

    const char *profile = doc["profile"] | to_string(cfg.profile);
    if (!profile_from_string(profile, cfg.profile)) {
        KNXB_LOGW(TAG, "Unknown profile '%s', defaulting to gateway", profile);
        cfg.profile = Profile::Gateway;
    }

    load_knx(doc["knx"].as<JsonObjectConst>(), cfg.knx);
    load_mqtt(doc["mqtt"].as<JsonObjectConst>(), cfg.mqtt);
    load_endpoints(doc["endpoints"].as<JsonObjectConst>(), cfg.endpoints);
    load_buffers(doc["buffers"].as<JsonObjectConst>(), cfg.buffers);

    JsonObjectConst logging = doc["logging"].as<JsonObjectConst>();
    if (!logging.isNull() && logging["level"].is<const char *>()) {
        cfg.log_level = log::level_from_string(logging["level"].as<const char *>());
    }

    JsonObjectConst diag_obj = doc["diagnostics"].as<JsonObjectConst>();
    if (!diag_obj.isNull()) {
        cfg.diagnostic_period_ms = diag_obj["period_ms"] | cfg.diagnostic_period_ms;
    }

    JsonObjectConst memory_obj = doc["memory"].as<JsonObjectConst>();
    if (!memory_obj.isNull()) {
        unsigned long bytes = memory_obj["arena_bytes"] | static_cast<unsigned long>(cfg.arena_bytes);
        if (bytes == 0) {
            KNXB_LOGW(TAG, "Arena size 0 invalid, keeping %zu bytes", cfg.arena_bytes);
        } else {
            cfg.arena_bytes = static_cast<size_t>(bytes);
        }
    }

    out = cfg;
    return true;
}

bool load_bridge_config(const std::string &path, BridgeConfig &out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        KNXB_LOGW(TAG, "Failed to open config file: %s", path.c_str());
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (text.empty()) {
        KNXB_LOGE(TAG, "Config file empty: %s", path.c_str());
        return false;
    }
    if (!parse_bridge_config(text, out)) {
        return false;
    }
    KNXB_LOGI(TAG, "Configuration loaded from %s", path.c_str());
    return true;
}

void apply_environment(BridgeConfig &cfg) {
    const char *broker = std::getenv("MQTT_BROKER");
    if (broker && broker[0] != '\0') {
        cfg.mqtt.broker_uri = broker;
        KNXB_LOGI(TAG, "MQTT broker overridden by environment: %s", broker);
    }
}

void log_bridge_config(const BridgeConfig &cfg) {
    KNXB_LOGI(TAG, "profile=%s log_level=%s", to_string(cfg.profile),
              log::level_to_string(cfg.log_level).c_str());
    if (cfg.profile == Profile::Gateway) {
        KNXB_LOGI(TAG, "KNX gateway %s:%u", cfg.knx.gateway_host.c_str(), cfg.knx.gateway_port);
    }
    KNXB_LOGI(TAG, "MQTT broker %s (port %u, client %s, qos %u, retain %s)",
              cfg.mqtt.broker_uri.c_str(), cfg.mqtt.port, cfg.mqtt.client_id.c_str(),
              cfg.mqtt.default_qos, cfg.mqtt.retain ? "true" : "false");
    KNXB_LOGI(TAG, "lights state %s -> %s, temperature %s -> %s, control %s -> %s",
              cfg.endpoints.lights_state_address.c_str(), cfg.endpoints.lights_state_topic.c_str(),
              cfg.endpoints.temperature_address.c_str(), cfg.endpoints.temperature_topic.c_str(),
              cfg.endpoints.lights_control_topic.c_str(), cfg.endpoints.lights_control_address.c_str());
    KNXB_LOGI(TAG, "ring capacity %zu, max subscribers %zu, arena %zu bytes, diag period %u ms",
              cfg.buffers.ring_capacity, cfg.buffers.max_subscribers, cfg.arena_bytes,
              cfg.diagnostic_period_ms);
}

const char *to_string(Profile profile) {
    switch (profile) {
        case Profile::Gateway:
            return "gateway";
        case Profile::Console:
            return "console";
        default:
            return "gateway";
    }
}

bool profile_from_string(const std::string &value, Profile &out) {
    if (value == "gateway") {
        out = Profile::Gateway;
        return true;
    }
    if (value == "console") {
        out = Profile::Console;
        return true;
    }
    return false;
}

} // namespace knxbridge
