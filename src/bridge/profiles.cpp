#include "bridge/profiles.hpp"

#include "clock.hpp"
#include "logger.hpp"

#include <string>

namespace knxbridge::bridge {
namespace {
constexpr const char *TAG = "profile";

using records::SwitchControl;
using records::SwitchState;
using records::Temperature;

std::string knx_url(const std::string &address) {
    return std::string(connector::kKnxScheme) + "://" + address;
}

std::string mqtt_url(const std::string &topic) {
    return std::string(connector::kMqttScheme) + "://" + topic;
}

store::BufferCfg latest(const BridgeConfig &cfg) {
    return store::BufferCfg::latest(cfg.buffers.max_subscribers);
}

} // namespace

MonitorFn<SwitchState> state_monitor() {
    return logging_monitor<SwitchState>("state-monitor", records::monitor::format_state);
}

MonitorFn<SwitchControl> control_monitor() {
    return logging_monitor<SwitchControl>("control-monitor", records::monitor::format_control);
}

MonitorFn<Temperature> temperature_monitor() {
    return logging_monitor<Temperature>("temperature-monitor", records::monitor::format_temperature);
}

void configure_gateway(BridgeBuilder &builder, const BridgeConfig &cfg) {
    const EndpointConfig &ep = cfg.endpoints;
    const std::string qos = std::to_string(cfg.mqtt.default_qos);
    const std::string retain = cfg.mqtt.retain ? "true" : "false";

    builder.configure<SwitchState>([&](RecordRegistrar<SwitchState> &reg) {
        const std::string address = ep.lights_state_address;
        reg.name("SwitchState")
            .buffer(latest(cfg))
            .tap("state_monitor", state_monitor())
            .link_from(knx_url(address))
            .with_deserializer([address](const codec::Bytes &payload, SwitchState &out) {
                return records::knx::switch_state_from_knx(payload, address, now_ms(), out);
            })
            .finish()
            .link_to(mqtt_url(ep.lights_state_topic))
            .with_config("qos", qos)
            .with_config("retain", retain)
            .with_serializer(records::json::serialize_state)
            .finish();
    });

    builder.configure<Temperature>([&](RecordRegistrar<Temperature> &reg) {
        const std::string address = ep.temperature_address;
        reg.name("Temperature")
            .buffer(latest(cfg))
            .tap("temperature_monitor", temperature_monitor())
            .link_from(knx_url(address))
            .with_deserializer([address](const codec::Bytes &payload, Temperature &out) {
                return records::knx::temperature_from_knx(payload, address, now_ms(), out);
            })
            .finish()
            .link_to(mqtt_url(ep.temperature_topic))
            .with_config("qos", qos)
            .with_config("retain", retain)
            .with_serializer(records::json::serialize_temperature)
            .finish();
    });

    builder.configure<SwitchControl>([&](RecordRegistrar<SwitchControl> &reg) {
        reg.name("SwitchControl")
            .buffer(latest(cfg))
            .tap("control_monitor", control_monitor())
            .link_from(mqtt_url(ep.lights_control_topic))
            .with_config("qos", qos)
            .with_deserializer([](const codec::Bytes &payload, SwitchControl &out) {
                return records::json::deserialize_control(payload, out);
            })
            .finish()
            .link_to(knx_url(ep.lights_control_address))
            .with_serializer(records::knx::switch_control_to_knx)
            .finish();
    });
}

void configure_console(BridgeBuilder &builder, const BridgeConfig &cfg) {
    const EndpointConfig &ep = cfg.endpoints;

    builder.configure<SwitchState>([&](RecordRegistrar<SwitchState> &reg) {
        reg.name("SwitchState")
            .buffer(store::BufferCfg::spmc_ring(cfg.buffers.ring_capacity, cfg.buffers.max_subscribers))
            .tap("state_monitor", state_monitor())
            .link_from(mqtt_url(ep.lights_state_topic))
            .with_config("qos", "1")
            .with_deserializer([](const codec::Bytes &payload, SwitchState &out) {
                return records::json::deserialize_state(payload, out);
            })
            .finish();
    });

    builder.configure<Temperature>([&](RecordRegistrar<Temperature> &reg) {
        reg.name("Temperature")
            .buffer(latest(cfg))
            .tap("temperature_monitor", temperature_monitor())
            .link_from(mqtt_url(ep.temperature_topic))
            .with_config("qos", "1")
            .with_deserializer([](const codec::Bytes &payload, Temperature &out) {
                return records::json::deserialize_temperature(payload, out);
            })
            .finish();
    });

    builder.configure<SwitchControl>([&](RecordRegistrar<SwitchControl> &reg) {
        reg.name("SwitchControl")
            .buffer(latest(cfg))
            .tap("control_monitor", control_monitor())
            .link_to(mqtt_url(ep.lights_control_topic))
            .with_config("qos", "1")
            .with_config("retain", "false")
            .with_serializer(records::json::serialize_control)
            .finish();
    });
}

BindingError assemble_profile(const BridgeConfig &cfg,
                              const ProfileConnectors &connectors,
                              std::unique_ptr<Bridge> &out) {
    BridgeBuilder builder;
    builder.with_diagnostics_period(cfg.diagnostic_period_ms);

    if (!connectors.mqtt) {
        KNXB_LOGE(TAG, "Profile %s needs an MQTT connector", to_string(cfg.profile));
        return BindingError::ConnectorUnavailable;
    }
    builder.with_connector(connectors.mqtt);

    switch (cfg.profile) {
        case Profile::Gateway:
            if (!connectors.knx) {
                KNXB_LOGE(TAG, "Profile gateway needs a KNX connector");
                return BindingError::ConnectorUnavailable;
            }
            builder.with_connector(connectors.knx);
            configure_gateway(builder, cfg);
            break;
        case Profile::Console:
            configure_console(builder, cfg);
            break;
    }

    KNXB_LOGI(TAG, "Assembling %s profile", to_string(cfg.profile));
    return builder.build(out);
}

} // namespace knxbridge::bridge
