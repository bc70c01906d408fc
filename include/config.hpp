#pragma once

#include "atc_crypto.hpp"
#include "logging.hpp"

#include <optional>
#include <string>

struct DecoderConfig {
    std::optional<Bindkey> bindkey;
    // False on hosts whose BLE stack hides device MACs behind opaque ids
    // (CoreBluetooth).
    bool identifier_trusted_from_transport;
    LogLevel log_level;
};

DecoderConfig default_config();

// default_config() overridden by ATC_BLE_BINDKEY, ATC_BLE_TRUST_TRANSPORT_MAC
// and ATC_BLE_LOG_LEVEL. Malformed values are logged and ignored.
DecoderConfig load_config();

// Any non-empty even-length hex string is accepted; only 16-byte keys
// decrypt, other lengths surface as InvalidKeyLength when used.
bool parse_bindkey_hex(const std::string& text, Bindkey& out);
bool parse_log_level(const std::string& text, LogLevel& out);
bool parse_flag(const std::string& text, bool& out);
