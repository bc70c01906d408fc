#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Upper-case hex, no separators.
std::string to_hex(const uint8_t* data, std::size_t len);
std::string to_hex(const std::vector<uint8_t>& data);

// Accepts upper or lower case digits and ignores ' ', ':' and '-' between
// byte pairs. Clears `out` and returns false on odd length or a bad digit.
bool from_hex(const std::string& text, std::vector<uint8_t>& out);
