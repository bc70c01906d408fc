#pragma once

#include "advertisement.hpp"
#include "crypto.hpp"
#include "fault.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Framing of the encrypted ATC/pvvx advertisements:
//   payload = [subtype:1][ciphertext:N][tag:4]
//   nonce   = reversed(mac)[6] || len(payload)+3 || 16 1A 18 || subtype
//   aad     = 0x11
constexpr std::size_t kAtcNonceLength = 11;
constexpr std::size_t kAtcTagLength = 4;
constexpr std::size_t kAtcFrameOverhead = 1 + kAtcTagLength;
constexpr uint8_t kAtcAad = 0x11;
constexpr std::array<uint8_t, 3> kAtcServiceTag{0x16, 0x1A, 0x18};

using AtcNonce = std::array<uint8_t, kAtcNonceLength>;
using Bindkey = std::vector<uint8_t>;

AtcNonce build_atc_nonce(const MacAddress& mac, std::size_t payload_len, uint8_t subtype);

// Checks the key, builds nonce/AAD from the frame and `mac`, and verifies and
// decrypts. Returns DecodeError::None with `plaintext` filled on success;
// MissingKey, InvalidKeyLength or DecryptionFailed otherwise.
DecodeError decrypt_atc_payload(const std::vector<uint8_t>& payload,
                                const MacAddress& mac,
                                const std::optional<Bindkey>& bindkey,
                                std::vector<uint8_t>& plaintext);

// Builds an encrypted frame around `plaintext`. Used by tooling and tests to
// produce frames a sensor would emit.
bool encrypt_atc_payload(const std::vector<uint8_t>& plaintext,
                         const MacAddress& mac,
                         const AesCcmKey& key,
                         uint8_t subtype,
                         std::vector<uint8_t>& payload);

bool make_ccm_key(const Bindkey& bindkey, AesCcmKey& out);
