#include <cassert>
#include <cmath>
#include <limits>
#include <string>

#include "records/switch.hpp"
#include "records/temperature.hpp"

using knxbridge::codec::Bytes;
using knxbridge::codec::DecodeError;
using knxbridge::codec::EncodeError;
using knxbridge::records::FieldMask;
using knxbridge::records::SwitchControl;
using knxbridge::records::SwitchState;
using knxbridge::records::Temperature;
namespace fields = knxbridge::records::fields;
namespace json = knxbridge::records::json;
namespace knx = knxbridge::records::knx;
namespace monitor = knxbridge::records::monitor;

namespace {

Bytes text(const std::string &value) {
    return Bytes(value.begin(), value.end());
}

std::string as_string(const Bytes &bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

int main() {
    {
        Bytes out;
        assert(json::serialize_state(SwitchState("1/0/7", true, 1234), out) == EncodeError::None);
        assert(as_string(out) == R"({"address":"1/0/7","is_on":true,"timestamp":1234})");

        SwitchState decoded;
        FieldMask present = fields::kNone;
        assert(json::deserialize_state(out, decoded, &present) == DecodeError::None);
        assert(decoded.address == "1/0/7");
        assert(decoded.is_on);
        assert(decoded.timestamp == 1234);
        assert(present == fields::kAll);
    }

    {
        // Missing fields fall back to zero values; the mask tells them apart.
        SwitchState decoded("9/9/9", true, 99);
        FieldMask present = fields::kAll;
        assert(json::deserialize_state(text(R"({"address":"1/0/7"})"), decoded, &present) ==
               DecodeError::None);
        assert(decoded.address == "1/0/7");
        assert(!decoded.is_on);
        assert(decoded.timestamp == 0);
        assert(present == fields::kAddress);

        assert(json::deserialize_state(text("{}"), decoded, &present) == DecodeError::None);
        assert(decoded.address.empty());
        assert(present == fields::kNone);

        // Wrong types count as absent.
        assert(json::deserialize_state(text(R"({"address":7,"is_on":"yes","timestamp":-1})"),
                                       decoded, &present) == DecodeError::None);
        assert(present == fields::kNone);
        assert(!decoded.is_on);
    }

    {
        SwitchControl decoded;
        FieldMask present = fields::kNone;
        assert(json::deserialize_control(
                   text(R"({"group_address":"1/0/6","is_on":true,"extra":[1,2]})"), decoded,
                   &present) == DecodeError::None);
        assert(decoded.address == "1/0/6");
        assert(decoded.is_on);
        assert(present == (fields::kAddress | fields::kValue));

        // The default argument skips the mask.
        assert(json::deserialize_control(text(R"({"address":"1/0/6","is_on":false})"), decoded) ==
               DecodeError::None);
        assert(!decoded.is_on);
    }

    {
        // Large payloads carrying many unrelated fields still decode.
        std::string payload = R"({"address":"9/1/0",)";
        for (int i = 0; i < 20; ++i) {
            payload += "\"vendor_field_" + std::to_string(i) + "\":\"value number " +
                       std::to_string(i) + "\",";
        }
        payload += R"("nested":{"a":[1,2,3],"b":{"c":"d"}},"celsius":22.5,"timestamp":77})";

        Temperature decoded;
        FieldMask present = fields::kNone;
        assert(json::deserialize_temperature(text(payload), decoded, &present) == DecodeError::None);
        assert(decoded.address == "9/1/0");
        assert(std::fabs(decoded.celsius - 22.5f) < 0.001f);
        assert(decoded.timestamp == 77);
        assert(present == (fields::kAddress | fields::kValue | fields::kTimestamp));
    }

    {
        SwitchState untouched("1/1/1", true, 5);
        assert(json::deserialize_state(text(""), untouched) == DecodeError::Malformed);
        assert(json::deserialize_state(text("not json"), untouched) == DecodeError::Malformed);
        assert(json::deserialize_state(text("[1,2,3]"), untouched) == DecodeError::Malformed);
        assert(json::deserialize_state(text("true"), untouched) == DecodeError::Malformed);
        assert(json::deserialize_state(text(R"({"address":"1/0/7")"), untouched) ==
               DecodeError::Malformed);
        assert(untouched.address == "1/1/1");
        assert(untouched.is_on);
        assert(untouched.timestamp == 5);
    }

    {
        Bytes out;
        assert(json::serialize_temperature(Temperature("9/1/0", 21.5f, 77), out) == EncodeError::None);
        Temperature decoded;
        FieldMask present = fields::kNone;
        assert(json::deserialize_temperature(out, decoded, &present) == DecodeError::None);
        assert(decoded.address == "9/1/0");
        assert(std::fabs(decoded.celsius - 21.5f) < 0.001f);
        assert(decoded.timestamp == 77);
        assert(present == fields::kAll);

        // Integers are accepted for the value field.
        assert(json::deserialize_temperature(text(R"({"celsius":20})"), decoded, &present) ==
               DecodeError::None);
        assert(std::fabs(decoded.celsius - 20.0f) < 0.001f);
        assert(present == fields::kValue);

        // Published values carry two decimals.
        assert(json::serialize_temperature(Temperature("9/1/0", 19.876f, 0), out) ==
               EncodeError::None);
        assert(as_string(out).find("19.88") != std::string::npos);

        assert(json::serialize_temperature(
                   Temperature("9/1/0", std::numeric_limits<float>::quiet_NaN(), 0), out) ==
               EncodeError::NotRepresentable);
        assert(json::serialize_temperature(
                   Temperature("9/1/0", std::numeric_limits<float>::infinity(), 0), out) ==
               EncodeError::NotRepresentable);
    }

    {
        SwitchState state;
        assert(knx::switch_state_from_knx(Bytes{0x01}, "1/0/7", 500, state) == DecodeError::None);
        assert(state.address == "1/0/7");
        assert(state.is_on);
        assert(state.timestamp == 500);

        SwitchState untouched("1/0/7", false, 1);
        assert(knx::switch_state_from_knx(Bytes{0x01, 0x00, 0x00}, "1/0/7", 2, untouched) ==
               DecodeError::LengthMismatch);
        assert(!untouched.is_on);
        assert(untouched.timestamp == 1);
        assert(knx::switch_state_from_knx(Bytes{0x01}, "1/0", 2, untouched) ==
               DecodeError::InvalidAddress);

        Bytes out;
        assert(knx::switch_state_to_knx(SwitchState("1/0/7", true, 0), out) == EncodeError::None);
        assert(out == Bytes{0x01});
        assert(knx::switch_control_to_knx(SwitchControl("1/0/6", false), out) == EncodeError::None);
        assert(out == Bytes{0x00});

        SwitchControl control;
        assert(knx::switch_control_from_knx(Bytes{0x03}, "1/0/6", 9, control) == DecodeError::None);
        assert(control.is_on);
        assert(control.timestamp == 9);
    }

    {
        Temperature temperature;
        assert(knx::temperature_from_knx(Bytes{0x0C, 0x1A}, "9/1/0", 10, temperature) ==
               DecodeError::None);
        assert(std::fabs(temperature.celsius - 21.0f) < 0.001f);
        assert(temperature.address == "9/1/0");
        assert(knx::temperature_from_knx(Bytes{0x7F, 0xFF}, "9/1/0", 10, temperature) ==
               DecodeError::InvalidValue);

        Bytes out;
        assert(knx::temperature_to_knx(Temperature("9/1/0", -30.0f, 0), out) == EncodeError::None);
        assert(out == (Bytes{0x8A, 0x24}));
    }

    {
        assert(monitor::format_state(SwitchState("1/0/7", true, 0)) == "1/0/7 = ON");
        assert(monitor::format_state(SwitchState("1/0/7", false, 0)) == "1/0/7 = OFF");
        assert(monitor::format_control(SwitchControl("1/0/6", true)) == "1/0/6 <- ON");
        assert(monitor::format_temperature(Temperature("9/1/0", 21.5f, 0)) == "9/1/0 = 21.5 C");
    }

    return 0;
}
