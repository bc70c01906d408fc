#include "advertisement.hpp"
#include <algorithm>
#include <cctype>

namespace {
int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
} // namespace

bool parse_mac_address(const std::string& text, MacAddress& out) {
    // Exactly "XX?XX?XX?XX?XX?XX" with one separator kind throughout.
    if (text.size() != kMacLength * 3 - 1) {
        return false;
    }
    const char sep = text[2];
    if (sep != ':' && sep != '-') {
        return false;
    }
    MacAddress mac{};
    for (std::size_t i = 0; i < kMacLength; ++i) {
        const std::size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != sep) {
            return false;
        }
        const int hi = hex_nibble(text[pos]);
        const int lo = hex_nibble(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        mac[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = mac;
    return true;
}

std::string format_mac_address(const MacAddress& mac) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(kMacLength * 3 - 1);
    for (std::size_t i = 0; i < mac.size(); ++i) {
        if (i > 0) out.push_back(':');
        out.push_back(hex[mac[i] >> 4]);
        out.push_back(hex[mac[i] & 0x0F]);
    }
    return out;
}

MacAddress reversed_mac(const MacAddress& mac) {
    MacAddress out = mac;
    std::reverse(out.begin(), out.end());
    return out;
}

std::string short_address(const std::string& address) {
    std::string normalized = address;
    std::replace(normalized.begin(), normalized.end(), '-', ':');

    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const std::size_t pos = normalized.find(':', start);
        if (pos == std::string::npos) {
            parts.push_back(normalized.substr(start));
            break;
        }
        parts.push_back(normalized.substr(start, pos - start));
        start = pos + 1;
    }

    if (parts.size() >= 2 && parts.back().size() == 2) {
        return upper(parts[parts.size() - 2] + parts.back());
    }
    return upper(parts.back());
}
