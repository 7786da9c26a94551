#include "codec/dpt.hpp"

#include <algorithm>
#include <cmath>

namespace knxbridge::codec {

const char *to_string(DecodeError error) {
    switch (error) {
        case DecodeError::None:
            return "none";
        case DecodeError::LengthMismatch:
            return "length mismatch";
        case DecodeError::InvalidValue:
            return "invalid value";
        case DecodeError::InvalidAddress:
            return "invalid address";
        case DecodeError::Malformed:
            return "malformed payload";
        default:
            return "unknown";
    }
}

const char *to_string(EncodeError error) {
    switch (error) {
        case EncodeError::None:
            return "none";
        case EncodeError::NotRepresentable:
            return "value not representable";
        case EncodeError::BufferTooSmall:
            return "buffer too small";
        case EncodeError::NoMemory:
            return "out of memory";
        default:
            return "unknown";
    }
}

namespace dpt {
namespace {

constexpr int kMantissaMin = -2048;
constexpr int kMantissaMax = 2047;
constexpr int kExponentMax = 15;

// Returns the exponent and mantissa for a value already clamped to the DPT 9 range.
void split_dpt9(double value, int &exponent, long &mantissa) {
    const double centi = value * 100.0;
    for (int e = 0; e <= kExponentMax; ++e) {
        long m = std::lround(centi / static_cast<double>(1 << e));
        if (m >= kMantissaMin && m <= kMantissaMax) {
            exponent = e;
            mantissa = m;
            return;
        }
    }
    exponent = kExponentMax;
    mantissa = centi < 0.0 ? kMantissaMin : kMantissaMax;
}

} // namespace

DecodeError decode_dpt1(const uint8_t *data, size_t length, bool &out) {
    if (data == nullptr || length != kDpt1Size) {
        return DecodeError::LengthMismatch;
    }
    out = (data[0] & 0x01u) != 0;
    return DecodeError::None;
}

EncodeError encode_dpt1(bool value, uint8_t *buffer, size_t capacity, size_t &written) {
    written = 0;
    if (buffer == nullptr || capacity < kDpt1Size) {
        return EncodeError::BufferTooSmall;
    }
    buffer[0] = value ? 0x01u : 0x00u;
    written = kDpt1Size;
    return EncodeError::None;
}

DecodeError decode_dpt1(const Bytes &payload, bool &out) {
    return decode_dpt1(payload.data(), payload.size(), out);
}

EncodeError encode_dpt1(bool value, Bytes &out) {
    uint8_t buf[kDpt1Size] = {0};
    size_t len = 0;
    EncodeError err = encode_dpt1(value, buf, sizeof(buf), len);
    if (err != EncodeError::None) {
        return err;
    }
    out.assign(buf, buf + len);
    return EncodeError::None;
}

DecodeError decode_dpt9(const uint8_t *data, size_t length, float &out) {
    if (data == nullptr || length != kDpt9Size) {
        return DecodeError::LengthMismatch;
    }

    const uint16_t raw = static_cast<uint16_t>((data[0] << 8) | data[1]);
    if (raw == kDpt9InvalidMarker) {
        return DecodeError::InvalidValue;
    }

    const int exponent = (data[0] >> 3) & 0x0F;
    int mantissa = ((data[0] & 0x07) << 8) | data[1];
    if (data[0] & 0x80u) {
        mantissa -= 2048;
    }

    out = static_cast<float>(0.01 * mantissa * static_cast<double>(1 << exponent));
    return DecodeError::None;
}

EncodeError encode_dpt9(float value, uint8_t *buffer, size_t capacity, size_t &written) {
    written = 0;
    if (std::isnan(value)) {
        return EncodeError::NotRepresentable;
    }
    if (buffer == nullptr || capacity < kDpt9Size) {
        return EncodeError::BufferTooSmall;
    }

    const double clamped = std::clamp(static_cast<double>(value), kDpt9Min, kDpt9Max);
    int exponent = 0;
    long mantissa = 0;
    split_dpt9(clamped, exponent, mantissa);

    const uint16_t bits = static_cast<uint16_t>(mantissa) & 0x0FFFu;
    buffer[0] = static_cast<uint8_t>((mantissa < 0 ? 0x80u : 0x00u) |
                                     (static_cast<uint8_t>(exponent) << 3) |
                                     ((bits >> 8) & 0x07u));
    buffer[1] = static_cast<uint8_t>(bits & 0xFFu);
    written = kDpt9Size;
    return EncodeError::None;
}

DecodeError decode_dpt9(const Bytes &payload, float &out) {
    return decode_dpt9(payload.data(), payload.size(), out);
}

EncodeError encode_dpt9(float value, Bytes &out) {
    uint8_t buf[kDpt9Size] = {0};
    size_t len = 0;
    EncodeError err = encode_dpt9(value, buf, sizeof(buf), len);
    if (err != EncodeError::None) {
        return err;
    }
    out.assign(buf, buf + len);
    return EncodeError::None;
}

float dpt9_resolution(float value) {
    if (std::isnan(value)) {
        return 0.0f;
    }
    int exponent = 0;
    long mantissa = 0;
    split_dpt9(std::clamp(static_cast<double>(value), kDpt9Min, kDpt9Max), exponent, mantissa);
    return static_cast<float>(0.01 * static_cast<double>(1 << exponent));
}

} // namespace dpt
} // namespace knxbridge::codec
