#include "crypto.hpp"
#include "logging.hpp"

#include <climits>
#include <memory>

#include <openssl/evp.h>

namespace {
constexpr const char* kTag = "CCM";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool ccm_params_valid(std::size_t data_len, std::size_t nonce_len, std::size_t tag_len) {
    if (data_len == 0 || data_len > static_cast<std::size_t>(INT_MAX)) return false;
    if (nonce_len < 7 || nonce_len > 13) return false;
    if (tag_len < 4 || tag_len > 16 || (tag_len % 2) != 0) return false;
    return true;
}

// CCM in OpenSSL needs IV and tag lengths configured before the key/nonce.
bool ccm_init(EVP_CIPHER_CTX* ctx,
              bool encrypt,
              const AesCcmKey& key,
              const uint8_t* nonce,
              std::size_t nonce_len,
              const uint8_t* expected_tag,
              std::size_t tag_len) {
    if (EVP_CipherInit_ex(ctx, EVP_aes_128_ccm(), nullptr, nullptr, nullptr, encrypt ? 1 : 0) != 1) {
        return false;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_CCM_SET_IVLEN, static_cast<int>(nonce_len), nullptr) != 1) {
        return false;
    }
    void* tag_arg = encrypt ? nullptr : const_cast<uint8_t*>(expected_tag);
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_CCM_SET_TAG, static_cast<int>(tag_len), tag_arg) != 1) {
        return false;
    }
    return EVP_CipherInit_ex(ctx, nullptr, nullptr, key.bytes.data(), nonce, encrypt ? 1 : 0) == 1;
}

// Declares the message length and feeds the AAD; both must precede the payload.
bool ccm_prepare(EVP_CIPHER_CTX* ctx, std::size_t data_len, const uint8_t* aad, std::size_t aad_len) {
    int out_len = 0;
    if (EVP_CipherUpdate(ctx, nullptr, &out_len, nullptr, static_cast<int>(data_len)) != 1) {
        return false;
    }
    if (aad_len > 0 && EVP_CipherUpdate(ctx, nullptr, &out_len, aad, static_cast<int>(aad_len)) != 1) {
        return false;
    }
    return true;
}
} // namespace

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
                             std::size_t auth_tag_len) {
    if (plaintext_len > max_ciphertext_len || !ccm_params_valid(plaintext_len, nonce_len, auth_tag_len)) {
        return {false, 0};
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        log_error(kTag, "EVP_CIPHER_CTX_new failed");
        return {false, 0};
    }
    if (!ccm_init(ctx.get(), true, key, nonce, nonce_len, nullptr, auth_tag_len) ||
        !ccm_prepare(ctx.get(), plaintext_len, aad, aad_len)) {
        log_error(kTag, "CCM encrypt setup failed");
        return {false, 0};
    }

    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext, &out_len, plaintext, static_cast<int>(plaintext_len)) != 1) {
        log_error(kTag, "EVP_EncryptUpdate failed");
        return {false, 0};
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + out_len, &final_len) != 1) {
        log_error(kTag, "EVP_EncryptFinal_ex failed");
        return {false, 0};
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_GET_TAG, static_cast<int>(auth_tag_len), auth_tag) != 1) {
        log_error(kTag, "reading CCM tag failed");
        return {false, 0};
    }
    return {true, static_cast<std::size_t>(out_len + final_len)};
}

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
                             std::size_t max_plaintext_len) {
    if (ciphertext_len > max_plaintext_len || !ccm_params_valid(ciphertext_len, nonce_len, auth_tag_len)) {
        return {false, 0};
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        log_error(kTag, "EVP_CIPHER_CTX_new failed");
        return {false, 0};
    }
    if (!ccm_init(ctx.get(), false, key, nonce, nonce_len, auth_tag, auth_tag_len) ||
        !ccm_prepare(ctx.get(), ciphertext_len, aad, aad_len)) {
        log_error(kTag, "CCM decrypt setup failed");
        return {false, 0};
    }

    // For CCM the tag is checked inside this call; a non-positive return
    // means authentication failed.
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext, &out_len, ciphertext, static_cast<int>(ciphertext_len)) <= 0) {
        return {false, 0};
    }
    return {true, static_cast<std::size_t>(out_len)};
}
