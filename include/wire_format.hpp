#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

enum class WireFormat : uint8_t {
    PvvxCustom = 1,      // layout A, plaintext
    Atc1441,             // layout B, plaintext
    PvvxEncrypted,       // layout A, AES-CCM
    Atc1441Encrypted,    // layout B, AES-CCM
};

struct WireFormatInfo {
    WireFormat format;
    std::size_t payload_len;
    bool encrypted;
    const char* firmware;
};

constexpr std::size_t kWireFormatCount = 4;

constexpr std::size_t kPvvxCustomLen = 15;
constexpr std::size_t kAtc1441Len = 13;
constexpr std::size_t kPvvxEncryptedLen = 11;
constexpr std::size_t kAtc1441EncryptedLen = 8;

const std::array<WireFormatInfo, kWireFormatCount>& wire_formats();

// Returns nullptr when no format has this payload length.
const WireFormatInfo* find_wire_format(std::size_t payload_len);
const WireFormatInfo& wire_format_info(WireFormat format);
