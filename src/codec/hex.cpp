#include "codec/hex.hpp"

#include <cctype>
#include <utility>

namespace knxbridge::codec {
namespace {

int nibble(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

bool append_token(std::string token, Bytes &bytes) {
    if (token.size() >= 2 && token[0] == '0' && (token[1] == 'x' || token[1] == 'X')) {
        token.erase(0, 2);
    }
    if (token.empty() || token.size() % 2 != 0) {
        return false;
    }
    for (size_t i = 0; i < token.size(); i += 2) {
        const int high = nibble(token[i]);
        const int low = nibble(token[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return true;
}

} // namespace

bool parse_hex(const std::string &text, Bytes &out) {
    Bytes bytes;
    std::string token;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == ':') {
            if (!token.empty() && !append_token(token, bytes)) {
                return false;
            }
            token.clear();
            continue;
        }
        token.push_back(ch);
    }
    if (!token.empty() && !append_token(token, bytes)) {
        return false;
    }
    if (bytes.empty()) {
        return false;
    }
    out = std::move(bytes);
    return true;
}

std::string to_hex(const Bytes &payload) {
    static const char *digits = "0123456789abcdef";
    std::string text;
    text.reserve(payload.size() * 2);
    for (uint8_t byte : payload) {
        text.push_back(digits[byte >> 4]);
        text.push_back(digits[byte & 0x0F]);
    }
    return text;
}

} // namespace knxbridge::codec
