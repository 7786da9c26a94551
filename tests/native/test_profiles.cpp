#include <cassert>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <thread>

#include "bridge/profiles.hpp"
#include "connector/loopback_connector.hpp"
#include "logger.hpp"

using knxbridge::BindingError;
using knxbridge::BridgeConfig;
using knxbridge::Profile;
using knxbridge::SubscriptionError;
using knxbridge::bridge::Bridge;
using knxbridge::bridge::ProfileConnectors;
using knxbridge::bridge::assemble_profile;
using knxbridge::codec::Bytes;
using knxbridge::codec::DecodeError;
using knxbridge::connector::LoopbackConnector;
using knxbridge::records::SwitchControl;
using knxbridge::records::SwitchState;
using knxbridge::records::Temperature;
using knxbridge::store::BufferKind;
using knxbridge::store::BufferReader;
namespace json = knxbridge::records::json;

namespace {

Bytes text(const std::string &value) {
    return Bytes(value.begin(), value.end());
}

bool logged(const std::string &tag, const std::string &message) {
    for (int attempt = 0; attempt < 1000; ++attempt) {
        for (const auto &entry : knxbridge::log::recent(256)) {
            if (entry.tag == tag && entry.message == message) {
                return true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

} // namespace

int main() {
    knxbridge::log::init();

    {
        BridgeConfig cfg;
        cfg.mqtt.default_qos = 2;
        cfg.mqtt.retain = true;
        auto knx = std::make_shared<LoopbackConnector>("knx");
        auto mqtt = std::make_shared<LoopbackConnector>("mqtt");

        std::unique_ptr<Bridge> bridge;
        assert(assemble_profile(cfg, ProfileConnectors{knx, mqtt}, bridge) == BindingError::None);
        assert(bridge);
        assert(bridge->monitors_running() == 3);

        // Light state from the bus, republished as JSON with the configured delivery.
        assert(knx->inject("1/0/7", Bytes{0x01}) == 1);
        assert(mqtt->wait_for_sent(1, std::chrono::milliseconds(2000)));
        auto states = mqtt->sent_to("knx/lights/state");
        assert(states.size() == 1);
        assert(states[0].options.qos == 2);
        assert(states[0].options.retain);
        SwitchState state;
        assert(json::deserialize_state(states[0].payload, state) == DecodeError::None);
        assert(state.address == "1/0/7" && state.is_on);
        assert(logged("state-monitor", "1/0/7 = ON"));

        // Temperature from the bus.
        assert(knx->inject("9/1/0", Bytes{0x0C, 0x1A}) == 1);
        assert(mqtt->wait_for_sent(2, std::chrono::milliseconds(2000)));
        auto temperatures = mqtt->sent_to("knx/temperature/state");
        assert(temperatures.size() == 1);
        Temperature temperature;
        assert(json::deserialize_temperature(temperatures[0].payload, temperature) ==
               DecodeError::None);
        assert(std::fabs(temperature.celsius - 21.0f) < 0.01f);
        assert(logged("temperature-monitor", "9/1/0 = 21.0 C"));

        // Light commands from the broker go to the bus as DPT 1.
        assert(mqtt->inject("knx/lights/control", text(R"({"address":"1/0/6","is_on":true})")) == 1);
        assert(knx->wait_for_sent(1, std::chrono::milliseconds(2000)));
        auto commands = knx->sent_to("1/0/6");
        assert(commands.size() == 1);
        assert(commands[0].payload == Bytes{0x01});
        assert(logged("control-monitor", "1/0/6 <- ON"));

        // Malformed command: dropped.
        assert(mqtt->inject("knx/lights/control", text("{not json")) == 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(knx->sent().size() == 1);

        assert(!bridge->write(SwitchControl("1/0/6", false)));
        bridge->stop();
        assert(!knx->running() && !mqtt->running());
    }

    {
        BridgeConfig cfg;
        cfg.profile = Profile::Console;
        cfg.buffers.ring_capacity = 4;
        auto mqtt = std::make_shared<LoopbackConnector>("mqtt");

        std::unique_ptr<Bridge> bridge;
        assert(assemble_profile(cfg, ProfileConnectors{nullptr, mqtt}, bridge) == BindingError::None);

        // State events keep a history; commands and temperature hold the latest value.
        bool saw_state = false;
        bool saw_control = false;
        bool saw_temperature = false;
        for (const auto &cell : bridge->health_snapshot().cells) {
            if (cell.record == "SwitchState") {
                saw_state = true;
                assert(cell.stats.kind == BufferKind::SpmcRing);
                assert(cell.stats.capacity == 4);
            } else if (cell.record == "SwitchControl") {
                saw_control = true;
                assert(cell.stats.kind == BufferKind::Latest);
            } else if (cell.record == "Temperature") {
                saw_temperature = true;
                assert(cell.stats.kind == BufferKind::Latest);
            }
        }
        assert(saw_state && saw_control && saw_temperature);

        // Commands are produced locally and published with qos 1, not retained.
        assert(bridge->write(SwitchControl("1/0/6", true, 10)));
        assert(mqtt->wait_for_sent(1, std::chrono::milliseconds(2000)));
        assert(bridge->write(SwitchControl("1/0/6", false, 11)));
        assert(mqtt->wait_for_sent(2, std::chrono::milliseconds(2000)));
        auto commands = mqtt->sent_to("knx/lights/control");
        assert(commands.size() == 2);
        assert(commands[0].options.qos == 1);
        assert(!commands[0].options.retain);
        SwitchControl second;
        assert(json::deserialize_control(commands[1].payload, second) == DecodeError::None);
        assert(!second.is_on && second.timestamp == 11);

        // State and temperature follow the broker.
        assert(mqtt->inject("knx/lights/state", text(R"({"address":"1/0/7","is_on":true,"timestamp":5})")) == 1);
        assert(logged("state-monitor", "1/0/7 = ON"));
        SwitchState state;
        assert(bridge->try_get(state) == SubscriptionError::None);
        assert(state.is_on && state.timestamp == 5);
        assert(!bridge->write(SwitchState("1/0/7", false, 6)));

        // Readers of the state ring see every event, in order.
        std::unique_ptr<BufferReader<SwitchState>> events;
        assert(bridge->subscribe(events) == SubscriptionError::None);
        assert(mqtt->inject("knx/lights/state", text(R"({"address":"1/0/7","is_on":false,"timestamp":7})")) == 1);
        assert(mqtt->inject("knx/lights/state", text(R"({"address":"1/0/7","is_on":true,"timestamp":8})")) == 1);
        SwitchState event;
        assert(events->next(event) == SubscriptionError::None);
        assert(!event.is_on && event.timestamp == 7);
        assert(events->next(event) == SubscriptionError::None);
        assert(event.is_on && event.timestamp == 8);

        assert(mqtt->inject("knx/temperature/state", text(R"({"address":"9/1/0","celsius":19.5})")) == 1);
        Temperature temperature;
        assert(bridge->get(temperature) == SubscriptionError::None);
        assert(std::fabs(temperature.celsius - 19.5f) < 0.001f);
    }

    {
        BridgeConfig cfg;
        auto mqtt = std::make_shared<LoopbackConnector>("mqtt");
        std::unique_ptr<Bridge> bridge;
        assert(assemble_profile(cfg, ProfileConnectors{nullptr, mqtt}, bridge) ==
               BindingError::ConnectorUnavailable);
        assert(!bridge);

        cfg.profile = Profile::Console;
        assert(assemble_profile(cfg, ProfileConnectors{nullptr, nullptr}, bridge) ==
               BindingError::ConnectorUnavailable);
    }

    {
        // An unreachable broker aborts the whole gateway.
        BridgeConfig cfg;
        auto knx = std::make_shared<LoopbackConnector>("knx");
        auto mqtt = std::make_shared<LoopbackConnector>("mqtt");
        mqtt->set_available(false);
        std::unique_ptr<Bridge> bridge;
        assert(assemble_profile(cfg, ProfileConnectors{knx, mqtt}, bridge) ==
               BindingError::ConnectorUnavailable);
        assert(!knx->running());
    }

    knxbridge::log::shutdown();
    return 0;
}
