#pragma once

#include "advertisement.hpp"
#include "atc_decode.hpp"
#include "config.hpp"
#include "fault.hpp"

#include <cstdint>
#include <optional>

// Per-device decode state. Transitions happen only on decode outcomes:
//   plaintext frame decoded            -> PlaintextObserved (unless already Encrypted*)
//   MissingKey / InvalidKeyLength      -> EncryptedKeyMissing
//   DecryptionFailed                   -> EncryptedFailed
//   encrypted frame verified + decoded -> EncryptedVerified
// UnrecognizedFormat, NoServiceData, IdentifierMismatch and
// PlatformUnsupported leave the state alone.
enum class SessionState : uint8_t {
    Unseen = 0,
    PlaintextObserved,
    EncryptedKeyMissing,
    EncryptedVerified,
    EncryptedFailed,
};

const char* session_state_name(SessionState state);

// Owned by one device's processing path; not thread safe.
class DecoderSession {
public:
    explicit DecoderSession(bool identifier_trusted_from_transport,
                            std::optional<Bindkey> bindkey = std::nullopt);
    explicit DecoderSession(const DecoderConfig& cfg);

    // Tries every service-data payload. Returns the first successful decode,
    // otherwise the most specific failure.
    DecodeResult update(const Advertisement& adv);

    // Replaces the key. A verified session drops back to unverified, then the
    // last successfully parsed advertisement (if any) is decoded again and
    // its result returned.
    std::optional<DecodeResult> set_bindkey(std::optional<Bindkey> bindkey);

    SessionState state() const { return state_; }
    // True until a payload of a recognized length has been processed.
    bool pending() const { return !processed_; }
    bool is_encrypted() const;
    bool bindkey_verified() const { return state_ == SessionState::EncryptedVerified; }
    bool mac_known() const { return mac_known_; }
    bool identifier_trusted_from_transport() const { return identifier_trusted_; }

    const std::optional<Bindkey>& bindkey() const { return bindkey_; }
    const std::optional<Advertisement>& last_advertisement() const { return last_advertisement_; }
    const DecodeFaultCounters& faults() const { return faults_; }

private:
    void apply_outcome(const DecodeResult& result);

    bool identifier_trusted_;
    std::optional<Bindkey> bindkey_;
    SessionState state_ = SessionState::Unseen;
    bool mac_known_;
    bool processed_ = false;
    std::optional<Advertisement> last_advertisement_;
    DecodeFaultCounters faults_{};
};
