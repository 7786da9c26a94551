#pragma once

#include <memory>

#include "bridge/bridge.hpp"
#include "config.hpp"
#include "records/switch.hpp"
#include "records/temperature.hpp"

namespace knxbridge::bridge {

struct ProfileConnectors {
    std::shared_ptr<connector::Connector> knx;
    std::shared_ptr<connector::Connector> mqtt;
};

MonitorFn<records::SwitchState> state_monitor();
MonitorFn<records::SwitchControl> control_monitor();
MonitorFn<records::Temperature> temperature_monitor();

/**
 * @brief KNX <-> MQTT gateway.
 *
 * Light state and temperature telegrams are republished as JSON; JSON light
 * commands from the broker are sent to the bus as DPT 1.001.
 */
void configure_gateway(BridgeBuilder &builder, const BridgeConfig &cfg);

/**
 * @brief MQTT-only console: follows light state and temperature, publishes
 * light commands produced locally (Bridge::write<SwitchControl>).
 */
void configure_console(BridgeBuilder &builder, const BridgeConfig &cfg);

// Registers the connectors the profile needs and its records, then assembles.
BindingError assemble_profile(const BridgeConfig &cfg,
                              const ProfileConnectors &connectors,
                              std::unique_ptr<Bridge> &out);

} // namespace knxbridge::bridge
