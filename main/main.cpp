#include "bridge/profiles.hpp"
#include "clock.hpp"
#include "codec/group_address.hpp"
#include "codec/hex.hpp"
#include "config.hpp"
#include "connector/endpoint.hpp"
#include "connector/loopback_connector.hpp"
#include "logger.hpp"
#include "memory/arena.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {
constexpr const char *TAG = "knxbridge-main";
constexpr const char *DEFAULT_CONFIG_PATH = "knxbridge.json";

void log_outbound(const std::string &scheme, const knxbridge::connector::SentMessage &message) {
    if (scheme == knxbridge::connector::kKnxScheme) {
        KNXB_LOGI(TAG, "-> knx://%s 0x%s", message.path.c_str(),
                  knxbridge::codec::to_hex(message.payload).c_str());
        return;
    }
    std::string text(message.payload.begin(), message.payload.end());
    KNXB_LOGI(TAG, "-> mqtt://%s %s (qos=%u retain=%s)", message.path.c_str(), text.c_str(),
              static_cast<unsigned>(message.options.qos), message.options.retain ? "true" : "false");
}

// `control <group-address> on|off` publishes a light command through the
// console profile's local producer.
bool handle_control(knxbridge::bridge::Bridge &bridge, std::istringstream &args) {
    std::string address;
    std::string state;
    args >> address >> state;
    if (!knxbridge::codec::is_valid_group_address(address) || (state != "on" && state != "off")) {
        KNXB_LOGW(TAG, "usage: control <main/middle/sub> on|off");
        return false;
    }
    return bridge.write(knxbridge::records::SwitchControl(address, state == "on", knxbridge::now_ms()));
}

void replay(knxbridge::bridge::Bridge &bridge,
            knxbridge::connector::LoopbackConnector *knx,
            knxbridge::connector::LoopbackConnector &mqtt) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::istringstream args(line);
        std::string head;
        args >> head;

        if (head == "control") {
            if (!handle_control(bridge, args)) {
                KNXB_LOGW(TAG, "Control command not applied: %s", line.c_str());
            }
            continue;
        }

        knxbridge::connector::Endpoint endpoint;
        if (!knxbridge::connector::parse_endpoint(head, endpoint)) {
            KNXB_LOGW(TAG, "Ignoring line, expected '<endpoint-url> <payload>': %s", line.c_str());
            continue;
        }
        std::string payload_text;
        std::getline(args >> std::ws, payload_text);

        knxbridge::codec::Bytes payload;
        if (endpoint.scheme == knxbridge::connector::kKnxScheme) {
            if (!knx) {
                KNXB_LOGW(TAG, "No KNX connector in this profile");
                continue;
            }
            if (!knxbridge::codec::parse_hex(payload_text, payload)) {
                KNXB_LOGW(TAG, "Invalid hex payload: %s", payload_text.c_str());
                continue;
            }
            knx->inject(endpoint.path, payload);
        } else if (endpoint.scheme == knxbridge::connector::kMqttScheme) {
            payload.assign(payload_text.begin(), payload_text.end());
            mqtt.inject(endpoint.path, payload);
        } else {
            KNXB_LOGW(TAG, "Unknown scheme '%s'", endpoint.scheme.c_str());
        }
    }
}

} // namespace

int main(int argc, char **argv) {
    knxbridge::log::init();

    knxbridge::BridgeConfig config;
    const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
    if (!knxbridge::load_bridge_config(config_path, config)) {
        KNXB_LOGW(TAG, "Using built-in configuration defaults");
    }
    knxbridge::apply_environment(config);
    knxbridge::log::set_global_level(config.log_level);
    knxbridge::log_bridge_config(config);

    if (!knxbridge::memory::init_arena(config.arena_bytes)) {
        KNXB_LOGE(TAG, "Failed to initialise memory arena");
        return 1;
    }

    auto mqtt = std::make_shared<knxbridge::connector::LoopbackConnector>(knxbridge::connector::kMqttScheme);
    std::shared_ptr<knxbridge::connector::LoopbackConnector> knx;
    if (config.profile == knxbridge::Profile::Gateway) {
        knx = std::make_shared<knxbridge::connector::LoopbackConnector>(knxbridge::connector::kKnxScheme);
        knx->set_send_hook([](const knxbridge::connector::SentMessage &message) {
            log_outbound(knxbridge::connector::kKnxScheme, message);
        });
    }
    mqtt->set_send_hook([](const knxbridge::connector::SentMessage &message) {
        log_outbound(knxbridge::connector::kMqttScheme, message);
    });

    knxbridge::bridge::ProfileConnectors connectors{knx, mqtt};
    std::unique_ptr<knxbridge::bridge::Bridge> bridge;
    knxbridge::BindingError err = knxbridge::bridge::assemble_profile(config, connectors, bridge);
    if (err != knxbridge::BindingError::None) {
        KNXB_LOGE(TAG, "Bridge assembly failed: %s", knxbridge::to_string(err));
        knxbridge::log::shutdown();
        return 1;
    }

    KNXB_LOGI(TAG, "KNX <-> MQTT bridge running (%s profile), reading stdin",
              knxbridge::to_string(config.profile));
    replay(*bridge, knx.get(), *mqtt);

    bridge->stop();
    knxbridge::diagnostics::log_snapshot(bridge->health_snapshot(), TAG);
    knxbridge::log::shutdown();
    return 0;
}
