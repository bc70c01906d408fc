#include "config.hpp"
#include "hex.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {
constexpr const char* kTag = "CONFIG";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}
} // namespace

DecoderConfig default_config() {
    DecoderConfig cfg{};
    cfg.bindkey = std::nullopt;
#ifdef __APPLE__
    cfg.identifier_trusted_from_transport = false;
#else
    cfg.identifier_trusted_from_transport = true;
#endif
    cfg.log_level = LogLevel::Info;
    return cfg;
}

DecoderConfig load_config() {
    DecoderConfig cfg = default_config();

    if (const char* level = env_value("ATC_BLE_LOG_LEVEL")) {
        if (!parse_log_level(level, cfg.log_level)) {
            log_warn(kTag, "ignoring ATC_BLE_LOG_LEVEL='%s'", level);
        }
    }
    if (const char* trust = env_value("ATC_BLE_TRUST_TRANSPORT_MAC")) {
        if (!parse_flag(trust, cfg.identifier_trusted_from_transport)) {
            log_warn(kTag, "ignoring ATC_BLE_TRUST_TRANSPORT_MAC='%s'", trust);
        }
    }
    if (const char* key_hex = env_value("ATC_BLE_BINDKEY")) {
        Bindkey key;
        if (!parse_bindkey_hex(key_hex, key)) {
            log_warn(kTag, "ignoring ATC_BLE_BINDKEY: not a hex string");
        } else {
            if (key.size() != kAesCcmKeyLen) {
                log_warn(kTag, "ATC_BLE_BINDKEY is %zu bytes, expected %zu", key.size(), kAesCcmKeyLen);
            }
            cfg.bindkey = key;
        }
    }
    return cfg;
}

bool parse_bindkey_hex(const std::string& text, Bindkey& out) {
    Bindkey key;
    if (!from_hex(text, key) || key.empty()) {
        return false;
    }
    out = key;
    return true;
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    const std::string v = lower(text);
    if (v == "debug") out = LogLevel::Debug;
    else if (v == "info") out = LogLevel::Info;
    else if (v == "warn" || v == "warning") out = LogLevel::Warn;
    else if (v == "error") out = LogLevel::Error;
    else if (v == "none" || v == "off") out = LogLevel::None;
    else return false;
    return true;
}

bool parse_flag(const std::string& text, bool& out) {
    const std::string v = lower(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}
