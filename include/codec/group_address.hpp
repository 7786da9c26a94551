#pragma once

#include <cstdint>
#include <string>

namespace knxbridge::codec {

/**
 * @brief KNX 3-level group address (main/middle/sub = 5/3/8 bits).
 */
struct GroupAddress {
    uint8_t main = 0;
    uint8_t middle = 0;
    uint8_t sub = 0;

    uint16_t raw() const {
        return static_cast<uint16_t>(((main & 0x1F) << 11) | ((middle & 0x07) << 8) | sub);
    }

    static GroupAddress from_raw(uint16_t raw) {
        GroupAddress ga;
        ga.main = static_cast<uint8_t>((raw >> 11) & 0x1F);
        ga.middle = static_cast<uint8_t>((raw >> 8) & 0x07);
        ga.sub = static_cast<uint8_t>(raw & 0xFF);
        return ga;
    }
};

bool parse_group_address(const std::string &text, GroupAddress &out);
std::string format_group_address(const GroupAddress &address);

inline bool is_valid_group_address(const std::string &text) {
    GroupAddress ignored;
    return parse_group_address(text, ignored);
}

} // namespace knxbridge::codec
