#include "records/switch.hpp"

#include "codec/dpt.hpp"
#include "codec/group_address.hpp"
#include "json_document.hpp"

namespace knxbridge::records {

namespace json {

codec::EncodeError serialize_state(const SwitchState &state, codec::Bytes &out) {
    detail::RecordDocument doc;
    doc["address"] = state.address;
    doc["is_on"] = state.is_on;
    doc["timestamp"] = state.timestamp;
    return detail::write_payload(doc, out);
}

codec::DecodeError deserialize_state(const codec::Bytes &payload, SwitchState &out,
                                     FieldMask *present) {
    detail::RecordDocument doc;
    JsonObjectConst obj;
    codec::DecodeError err = detail::parse_object(payload, doc, obj);
    if (err != codec::DecodeError::None) {
        return err;
    }

    FieldMask mask = fields::kNone;
    SwitchState decoded;
    if (detail::read_address(obj, decoded.address)) {
        mask |= fields::kAddress;
    }
    if (obj["is_on"].is<bool>()) {
        decoded.is_on = obj["is_on"].as<bool>();
        mask |= fields::kValue;
    }
    if (obj["timestamp"].is<uint64_t>()) {
        decoded.timestamp = obj["timestamp"].as<uint64_t>();
        mask |= fields::kTimestamp;
    }

    out = std::move(decoded);
    if (present) {
        *present = mask;
    }
    return codec::DecodeError::None;
}

codec::EncodeError serialize_control(const SwitchControl &control, codec::Bytes &out) {
    detail::RecordDocument doc;
    doc["address"] = control.address;
    doc["is_on"] = control.is_on;
    doc["timestamp"] = control.timestamp;
    return detail::write_payload(doc, out);
}

codec::DecodeError deserialize_control(const codec::Bytes &payload, SwitchControl &out,
                                       FieldMask *present) {
    detail::RecordDocument doc;
    JsonObjectConst obj;
    codec::DecodeError err = detail::parse_object(payload, doc, obj);
    if (err != codec::DecodeError::None) {
        return err;
    }

    FieldMask mask = fields::kNone;
    SwitchControl decoded;
    if (detail::read_address(obj, decoded.address)) {
        mask |= fields::kAddress;
    }
    if (obj["is_on"].is<bool>()) {
        decoded.is_on = obj["is_on"].as<bool>();
        mask |= fields::kValue;
    }
    if (obj["timestamp"].is<uint64_t>()) {
        decoded.timestamp = obj["timestamp"].as<uint64_t>();
        mask |= fields::kTimestamp;
    }

    out = std::move(decoded);
    if (present) {
        *present = mask;
    }
    return codec::DecodeError::None;
}

} // namespace json

namespace knx {

codec::DecodeError switch_state_from_knx(const codec::Bytes &payload, const std::string &address,
                                         uint64_t timestamp, SwitchState &out) {
    if (!codec::is_valid_group_address(address)) {
        return codec::DecodeError::InvalidAddress;
    }
    bool on = false;
    codec::DecodeError err = codec::dpt::decode_dpt1(payload, on);
    if (err != codec::DecodeError::None) {
        return err;
    }
    out = SwitchState(address, on, timestamp);
    return codec::DecodeError::None;
}

codec::EncodeError switch_state_to_knx(const SwitchState &state, codec::Bytes &out) {
    return codec::dpt::encode_dpt1(state.is_on, out);
}

codec::EncodeError switch_control_to_knx(const SwitchControl &control, codec::Bytes &out) {
    return codec::dpt::encode_dpt1(control.is_on, out);
}

codec::DecodeError switch_control_from_knx(const codec::Bytes &payload, const std::string &address,
                                           uint64_t timestamp, SwitchControl &out) {
    if (!codec::is_valid_group_address(address)) {
        return codec::DecodeError::InvalidAddress;
    }
    bool on = false;
    codec::DecodeError err = codec::dpt::decode_dpt1(payload, on);
    if (err != codec::DecodeError::None) {
        return err;
    }
    out = SwitchControl(address, on, timestamp);
    return codec::DecodeError::None;
}

} // namespace knx

namespace monitor {

std::string format_state(const SwitchState &state) {
    return state.address + " = " + (state.is_on ? "ON" : "OFF");
}

std::string format_control(const SwitchControl &control) {
    return control.address + " <- " + (control.is_on ? "ON" : "OFF");
}

} // namespace monitor

} // namespace knxbridge::records
