#pragma once

#include "codec/codec_types.hpp"
#include "records/record_fields.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace knxbridge::records {

/**
 * @brief Reported state of a switching actuator (DPT 1.001 on the bus).
 */
struct SwitchState {
    static constexpr const char *kMqttTopic = "knx/lights/state";

    std::string address;
    bool is_on = false;
    uint64_t timestamp = 0;

    SwitchState() = default;
    SwitchState(std::string addr, bool on, uint64_t ts)
        : address(std::move(addr)), is_on(on), timestamp(ts) {}
};

/**
 * @brief Command sent to a switching actuator.
 */
struct SwitchControl {
    static constexpr const char *kMqttTopic = "knx/lights/control";

    std::string address;
    bool is_on = false;
    uint64_t timestamp = 0;

    SwitchControl() = default;
    SwitchControl(std::string addr, bool on, uint64_t ts = 0)
        : address(std::move(addr)), is_on(on), timestamp(ts) {}
};

namespace json {

codec::EncodeError serialize_state(const SwitchState &state, codec::Bytes &out);
codec::DecodeError deserialize_state(const codec::Bytes &payload, SwitchState &out,
                                     FieldMask *present = nullptr);

codec::EncodeError serialize_control(const SwitchControl &control, codec::Bytes &out);
codec::DecodeError deserialize_control(const codec::Bytes &payload, SwitchControl &out,
                                       FieldMask *present = nullptr);

} // namespace json

namespace knx {

// The telegram carries no address or timestamp; both come from the caller.
codec::DecodeError switch_state_from_knx(const codec::Bytes &payload, const std::string &address,
                                         uint64_t timestamp, SwitchState &out);
codec::EncodeError switch_state_to_knx(const SwitchState &state, codec::Bytes &out);

codec::EncodeError switch_control_to_knx(const SwitchControl &control, codec::Bytes &out);
codec::DecodeError switch_control_from_knx(const codec::Bytes &payload, const std::string &address,
                                           uint64_t timestamp, SwitchControl &out);

} // namespace knx

namespace monitor {

std::string format_state(const SwitchState &state);
std::string format_control(const SwitchControl &control);

} // namespace monitor

} // namespace knxbridge::records
