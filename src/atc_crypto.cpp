#include "atc_crypto.hpp"
#include "hex.hpp"
#include "logging.hpp"

#include <algorithm>

namespace {
constexpr const char* kTag = "CCM";
} // namespace

AtcNonce build_atc_nonce(const MacAddress& mac, std::size_t payload_len, uint8_t subtype) {
    AtcNonce nonce{};
    const MacAddress rev = reversed_mac(mac);
    std::copy(rev.begin(), rev.end(), nonce.begin());
    nonce[kMacLength] = static_cast<uint8_t>(payload_len + 3);
    std::copy(kAtcServiceTag.begin(), kAtcServiceTag.end(), nonce.begin() + kMacLength + 1);
    nonce[kAtcNonceLength - 1] = subtype;
    return nonce;
}

bool make_ccm_key(const Bindkey& bindkey, AesCcmKey& out) {
    if (bindkey.size() != kAesCcmKeyLen) {
        return false;
    }
    std::copy(bindkey.begin(), bindkey.end(), out.bytes.begin());
    return true;
}

DecodeError decrypt_atc_payload(const std::vector<uint8_t>& payload,
                                const MacAddress& mac,
                                const std::optional<Bindkey>& bindkey,
                                std::vector<uint8_t>& plaintext) {
    plaintext.clear();
    if (!bindkey || bindkey->empty()) {
        log_debug(kTag, "Encryption key not set and adv is encrypted");
        return DecodeError::MissingKey;
    }
    AesCcmKey key{};
    if (!make_ccm_key(*bindkey, key)) {
        log_error(kTag, "Encryption key should be 16 bytes (32 characters) long, got %zu bytes",
                  bindkey->size());
        return DecodeError::InvalidKeyLength;
    }
    if (payload.size() <= kAtcFrameOverhead) {
        log_warn(kTag, "Decryption failed: frame too short (%zu bytes)", payload.size());
        return DecodeError::DecryptionFailed;
    }

    const AtcNonce nonce = build_atc_nonce(mac, payload.size(), payload[0]);
    const uint8_t aad = kAtcAad;
    const uint8_t* ciphertext = payload.data() + 1;
    const std::size_t ciphertext_len = payload.size() - kAtcFrameOverhead;
    const uint8_t* token = payload.data() + payload.size() - kAtcTagLength;

    plaintext.resize(ciphertext_len);
    const AesCcmResult res = aes_ccm_decrypt(ciphertext, ciphertext_len, key,
                                             nonce.data(), nonce.size(),
                                             &aad, 1,
                                             token, kAtcTagLength,
                                             plaintext.data(), plaintext.size());
    if (!res.ok) {
        plaintext.clear();
        log_warn(kTag, "Decryption failed for %s", format_mac_address(mac).c_str());
        log_debug(kTag, "token: %s", to_hex(token, kAtcTagLength).c_str());
        log_debug(kTag, "nonce: %s", to_hex(nonce.data(), nonce.size()).c_str());
        log_debug(kTag, "encrypted_payload: %s", to_hex(ciphertext, ciphertext_len).c_str());
        return DecodeError::DecryptionFailed;
    }
    plaintext.resize(res.len);
    return DecodeError::None;
}

bool encrypt_atc_payload(const std::vector<uint8_t>& plaintext,
                         const MacAddress& mac,
                         const AesCcmKey& key,
                         uint8_t subtype,
                         std::vector<uint8_t>& payload) {
    payload.assign(plaintext.size() + kAtcFrameOverhead, 0);
    payload[0] = subtype;

    const AtcNonce nonce = build_atc_nonce(mac, payload.size(), subtype);
    const uint8_t aad = kAtcAad;
    const AesCcmResult res = aes_ccm_encrypt(plaintext.data(), plaintext.size(), key,
                                             nonce.data(), nonce.size(),
                                             &aad, 1,
                                             payload.data() + 1, plaintext.size(),
                                             payload.data() + payload.size() - kAtcTagLength,
                                             kAtcTagLength);
    if (!res.ok) {
        payload.clear();
        return false;
    }
    return true;
}
