#pragma once

#include "codec/codec_types.hpp"
#include "records/record_fields.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace knxbridge::records {

/**
 * @brief Room temperature reading (DPT 9.001 on the bus).
 */
struct Temperature {
    static constexpr const char *kMqttTopic = "knx/temperature/state";

    std::string address;
    float celsius = 0.0f;
    uint64_t timestamp = 0;

    Temperature() = default;
    Temperature(std::string addr, float value, uint64_t ts)
        : address(std::move(addr)), celsius(value), timestamp(ts) {}
};

namespace json {

codec::EncodeError serialize_temperature(const Temperature &temperature, codec::Bytes &out);
codec::DecodeError deserialize_temperature(const codec::Bytes &payload, Temperature &out,
                                           FieldMask *present = nullptr);

} // namespace json

namespace knx {

codec::DecodeError temperature_from_knx(const codec::Bytes &payload, const std::string &address,
                                        uint64_t timestamp, Temperature &out);
codec::EncodeError temperature_to_knx(const Temperature &temperature, codec::Bytes &out);

} // namespace knx

namespace monitor {

std::string format_temperature(const Temperature &temperature);

} // namespace monitor

} // namespace knxbridge::records
