#include "records/temperature.hpp"

#include "codec/dpt.hpp"
#include "codec/group_address.hpp"
#include "json_document.hpp"

#include <cmath>
#include <cstdio>

namespace knxbridge::records {

namespace json {

codec::EncodeError serialize_temperature(const Temperature &temperature, codec::Bytes &out) {
    if (!std::isfinite(temperature.celsius)) {
        return codec::EncodeError::NotRepresentable;
    }
    detail::RecordDocument doc;
    doc["address"] = temperature.address;
    // Two decimals, finer than any DPT 9.001 step.
    doc["celsius"] = std::round(static_cast<double>(temperature.celsius) * 100.0) / 100.0;
    doc["timestamp"] = temperature.timestamp;
    return detail::write_payload(doc, out);
}

codec::DecodeError deserialize_temperature(const codec::Bytes &payload, Temperature &out,
                                           FieldMask *present) {
    detail::RecordDocument doc;
    JsonObjectConst obj;
    codec::DecodeError err = detail::parse_object(payload, doc, obj);
    if (err != codec::DecodeError::None) {
        return err;
    }

    FieldMask mask = fields::kNone;
    Temperature decoded;
    if (detail::read_address(obj, decoded.address)) {
        mask |= fields::kAddress;
    }
    if (obj["celsius"].is<float>()) {
        decoded.celsius = obj["celsius"].as<float>();
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

codec::DecodeError temperature_from_knx(const codec::Bytes &payload, const std::string &address,
                                        uint64_t timestamp, Temperature &out) {
    if (!codec::is_valid_group_address(address)) {
        return codec::DecodeError::InvalidAddress;
    }
    float celsius = 0.0f;
    codec::DecodeError err = codec::dpt::decode_dpt9(payload, celsius);
    if (err != codec::DecodeError::None) {
        return err;
    }
    out = Temperature(address, celsius, timestamp);
    return codec::DecodeError::None;
}

codec::EncodeError temperature_to_knx(const Temperature &temperature, codec::Bytes &out) {
    return codec::dpt::encode_dpt9(temperature.celsius, out);
}

} // namespace knx

namespace monitor {

std::string format_temperature(const Temperature &temperature) {
    char value[32];
    std::snprintf(value, sizeof(value), "%.1f", static_cast<double>(temperature.celsius));
    return temperature.address + " = " + value + " C";
}

} // namespace monitor

} // namespace knxbridge::records
