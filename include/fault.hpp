#pragma once

#include <cstdint>

enum class DecodeError : uint8_t {
    None = 0,
    UnrecognizedFormat,
    IdentifierMismatch,
    PlatformUnsupported,
    MissingKey,
    InvalidKeyLength,
    DecryptionFailed,
    NoServiceData,
};

struct DecodeFaultCounters {
    uint32_t decoded;
    uint32_t unrecognized_format;
    uint32_t identifier_mismatch;
    uint32_t platform_unsupported;
    uint32_t missing_key;
    uint32_t invalid_key_length;
    uint32_t decryption_failed;
    uint32_t no_service_data;
    DecodeError last_error;
};

const char* decode_error_name(DecodeError error);

// True for the errors that a corrected bindkey can resolve.
bool is_key_error(DecodeError error);

void record_decode_outcome(DecodeFaultCounters& counters, DecodeError error);
uint32_t total_decode_failures(const DecodeFaultCounters& counters);
