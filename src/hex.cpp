#include "hex.hpp"

namespace {
int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool is_separator(char c) {
    return c == ' ' || c == ':' || c == '-';
}
} // namespace

std::string to_hex(const uint8_t* data, std::size_t len) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(hex[data[i] >> 4]);
        out.push_back(hex[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

bool from_hex(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    int high = -1;
    for (char c : text) {
        if (is_separator(c)) {
            if (high >= 0) break; // separator inside a byte pair
            continue;
        }
        const int nibble = hex_nibble(c);
        if (nibble < 0) {
            out.clear();
            return false;
        }
        if (high < 0) {
            high = nibble;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | nibble));
            high = -1;
        }
    }
    if (high >= 0) {
        out.clear();
        return false;
    }
    return true;
}
