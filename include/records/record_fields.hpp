#pragma once

#include <cstdint>

namespace knxbridge::records {

/**
 * @brief Bit set of the JSON fields that were present (with the expected type)
 * in a decoded payload.
 *
 * Textual decoding is tolerant: a missing field falls back to its zero value
 * and the decode still succeeds. Callers that must tell "absent" from
 * "present with the default value" pass a FieldMask to the deserializer.
 */
using FieldMask = uint8_t;

namespace fields {
constexpr FieldMask kNone = 0;
constexpr FieldMask kAddress = 1u << 0;
constexpr FieldMask kValue = 1u << 1;
constexpr FieldMask kTimestamp = 1u << 2;
constexpr FieldMask kAll = kAddress | kValue | kTimestamp;
} // namespace fields

} // namespace knxbridge::records
