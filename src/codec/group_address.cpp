#include "codec/group_address.hpp"

#include <array>
#include <cctype>

namespace knxbridge::codec {
namespace {

constexpr std::array<unsigned, 3> kLevelLimits = {31u, 7u, 255u};

} // namespace

bool parse_group_address(const std::string &text, GroupAddress &out) {
    std::array<unsigned, 3> levels{};
    size_t level = 0;
    size_t digits = 0;
    unsigned value = 0;

    for (char ch : text) {
        if (ch == '/') {
            if (digits == 0 || level >= 2) {
                return false;
            }
            levels[level++] = value;
            value = 0;
            digits = 0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(ch)) || digits >= 3) {
            return false;
        }
        value = value * 10u + static_cast<unsigned>(ch - '0');
        ++digits;
    }

    if (digits == 0 || level != 2) {
        return false;
    }
    levels[level] = value;

    for (size_t i = 0; i < levels.size(); ++i) {
        if (levels[i] > kLevelLimits[i]) {
            return false;
        }
    }

    out.main = static_cast<uint8_t>(levels[0]);
    out.middle = static_cast<uint8_t>(levels[1]);
    out.sub = static_cast<uint8_t>(levels[2]);
    return true;
}

std::string format_group_address(const GroupAddress &address) {
    return std::to_string(address.main & 0x1F) + '/' +
           std::to_string(address.middle & 0x07) + '/' +
           std::to_string(address.sub);
}

} // namespace knxbridge::codec
