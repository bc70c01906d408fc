#pragma once

#include <cstddef>
#include <cstdint>
#include <array>

constexpr std::size_t kAesCcmKeyLen = 16;

struct AesCcmKey {
    std::array<uint8_t, kAesCcmKeyLen> bytes;
};

struct AesCcmResult {
    bool ok;
    std::size_t len;
};

// AES-128-CCM. `nonce_len` must be 7..13 and `auth_tag_len` one of
// 4, 6, 8, 10, 12, 14, 16.

// Encrypts `plaintext` into `ciphertext`, writes the tag into `auth_tag`.
AesCcmResult aes_ccm_encrypt(const uint8_t* plaintext,
                             std::size_t plaintext_len,
                             const AesCcmKey& key,
                             const uint8_t* nonce,
                             std::size_t nonce_len,
                             const uint8_t* aad,
                             std::size_t aad_len,
                             uint8_t* ciphertext,
                             std::size_t max_ciphertext_len,
                             uint8_t* auth_tag,
                             std::size_t auth_tag_len);

// Verifies `auth_tag` over aad || ciphertext and decrypts. `ok` is false
// on any tag mismatch; `plaintext` contents are unspecified then.
AesCcmResult aes_ccm_decrypt(const uint8_t* ciphertext,
                             std::size_t ciphertext_len,
                             const AesCcmKey& key,
                             const uint8_t* nonce,
                             std::size_t nonce_len,
                             const uint8_t* aad,
                             std::size_t aad_len,
                             const uint8_t* auth_tag,
                             std::size_t auth_tag_len,
                             uint8_t* plaintext,
                             std::size_t max_plaintext_len);
