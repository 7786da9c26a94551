#pragma once

#include <string>

#include "codec/codec_types.hpp"

namespace knxbridge::codec {

// Reads a telegram payload typed on a console: `0C1A`, `0x0C 0x1A`, `0c:1a`.
// Each whitespace- or colon-separated token may carry its own `0x` prefix and
// must hold whole bytes. `out` is left untouched on failure.
bool parse_hex(const std::string &text, Bytes &out);

// Lowercase, no prefix, no separators.
std::string to_hex(const Bytes &payload);

} // namespace knxbridge::codec
