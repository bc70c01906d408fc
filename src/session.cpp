#include "session.hpp"
#include "logging.hpp"

#include <utility>

namespace {
constexpr const char* kTag = "SESSION";

// Ranks failures so update() reports the one most useful to the caller.
int failure_rank(const DecodeResult& r) {
    if (r.ok()) {
        return 4;
    }
    if (is_key_error(r.error)) {
        return 3;
    }
    switch (r.error) {
        case DecodeError::IdentifierMismatch:
        case DecodeError::PlatformUnsupported: return 2;
        case DecodeError::UnrecognizedFormat: return 1;
        default: return 0;
    }
}
} // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Unseen: return "Unseen";
        case SessionState::PlaintextObserved: return "PlaintextObserved";
        case SessionState::EncryptedKeyMissing: return "EncryptedKeyMissing";
        case SessionState::EncryptedVerified: return "EncryptedVerified";
        case SessionState::EncryptedFailed: return "EncryptedFailed";
    }
    return "Unknown";
}

DecoderSession::DecoderSession(bool identifier_trusted_from_transport, std::optional<Bindkey> bindkey)
    : identifier_trusted_(identifier_trusted_from_transport),
      bindkey_(std::move(bindkey)),
      mac_known_(identifier_trusted_from_transport) {}

DecoderSession::DecoderSession(const DecoderConfig& cfg)
    : DecoderSession(cfg.identifier_trusted_from_transport, cfg.bindkey) {}

bool DecoderSession::is_encrypted() const {
    return state_ == SessionState::EncryptedKeyMissing ||
           state_ == SessionState::EncryptedVerified ||
           state_ == SessionState::EncryptedFailed;
}

DecodeResult DecoderSession::update(const Advertisement& adv) {
    log_debug(kTag, "Parsing ATC BLE advertisement from %s (rssi=%d, %zu payloads)",
              adv.address.c_str(), static_cast<int>(adv.rssi), adv.service_data.size());

    if (adv.service_data.empty()) {
        DecodeResult none{};
        none.error = DecodeError::NoServiceData;
        record_decode_outcome(faults_, none.error);
        return none;
    }

    std::optional<DecodeResult> best;
    for (const auto& entry : adv.service_data) {
        DecodeResult r = decode_atc_payload(entry.second, adv, identifier_trusted_, bindkey_);
        apply_outcome(r);
        record_decode_outcome(faults_, r.error);
        if (r.ok()) {
            last_advertisement_ = adv;
        }
        if (!best || failure_rank(r) > failure_rank(*best)) {
            best = std::move(r);
        }
    }
    return *best;
}

std::optional<DecodeResult> DecoderSession::set_bindkey(std::optional<Bindkey> bindkey) {
    bindkey_ = std::move(bindkey);
    if (is_encrypted()) {
        state_ = bindkey_ ? SessionState::EncryptedFailed : SessionState::EncryptedKeyMissing;
    }
    log_info(kTag, "bindkey %s, state %s", bindkey_ ? "replaced" : "cleared", session_state_name(state_));

    if (!last_advertisement_) {
        return std::nullopt;
    }
    // Copy: update() overwrites the cache on success.
    const Advertisement cached = *last_advertisement_;
    return update(cached);
}

void DecoderSession::apply_outcome(const DecodeResult& result) {
    const SessionState before = state_;
    if (result.format != nullptr) {
        processed_ = true;
    }
    switch (result.error) {
        case DecodeError::None:
            if (result.encrypted()) {
                state_ = SessionState::EncryptedVerified;
            } else if (!is_encrypted()) {
                // A plaintext frame is not a failed decrypt; encrypted states stay.
                state_ = SessionState::PlaintextObserved;
            }
            if (result.mac_from_payload) {
                mac_known_ = true;
            }
            break;
        case DecodeError::MissingKey:
        case DecodeError::InvalidKeyLength:
            state_ = SessionState::EncryptedKeyMissing;
            break;
        case DecodeError::DecryptionFailed:
            state_ = SessionState::EncryptedFailed;
            break;
        case DecodeError::UnrecognizedFormat:
        case DecodeError::IdentifierMismatch:
        case DecodeError::PlatformUnsupported:
        case DecodeError::NoServiceData:
            break;
    }
    if (state_ != before) {
        log_debug(kTag, "%s -> %s (%s)", session_state_name(before), session_state_name(state_),
                  decode_error_name(result.error));
    }
}
