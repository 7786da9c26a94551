#pragma once

#include <cstdint>
#include <vector>

namespace knxbridge::codec {

using Bytes = std::vector<uint8_t>;

enum class DecodeError : uint8_t {
    None = 0,
    LengthMismatch,
    InvalidValue,
    InvalidAddress,
    Malformed,
};

enum class EncodeError : uint8_t {
    None = 0,
    NotRepresentable,
    BufferTooSmall,
    NoMemory,
};

const char *to_string(DecodeError error);
const char *to_string(EncodeError error);

} // namespace knxbridge::codec
