#pragma once

#include "codec/codec_types.hpp"

#include <cstddef>
#include <cstdint>

namespace knxbridge::codec::dpt {

constexpr size_t kDpt1Size = 1;
constexpr size_t kDpt9Size = 2;

// 0x7FFF is reserved for "invalid data", so the largest encodable value is 0x7FFE.
constexpr double kDpt9Min = -671088.64;
constexpr double kDpt9Max = 670433.28;
constexpr uint16_t kDpt9InvalidMarker = 0x7FFF;

/**
 * @brief DPT 1.001 (switch). Only bit 0 of the single payload byte is used.
 */
DecodeError decode_dpt1(const uint8_t *data, size_t length, bool &out);
EncodeError encode_dpt1(bool value, uint8_t *buffer, size_t capacity, size_t &written);

DecodeError decode_dpt1(const Bytes &payload, bool &out);
EncodeError encode_dpt1(bool value, Bytes &out);

/**
 * @brief DPT 9.001 (2-octet float, e.g. temperature in degrees Celsius).
 *
 * Wire layout is `MEEEEMMM MMMMMMMM` with value = 0.01 * M * 2^E, M being a
 * 12-bit two's complement mantissa. Encoding selects the smallest exponent
 * whose rounded mantissa fits and saturates outside [kDpt9Min, kDpt9Max].
 * The KNX "invalid data" marker 0x7FFF decodes to DecodeError::InvalidValue.
 */
DecodeError decode_dpt9(const uint8_t *data, size_t length, float &out);
EncodeError encode_dpt9(float value, uint8_t *buffer, size_t capacity, size_t &written);

DecodeError decode_dpt9(const Bytes &payload, float &out);
EncodeError encode_dpt9(float value, Bytes &out);

// Quantisation step (0.01 * 2^E) of the encoding chosen for value.
float dpt9_resolution(float value);

} // namespace knxbridge::codec::dpt
