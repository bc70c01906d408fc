#include "fault.hpp"

const char* decode_error_name(DecodeError error) {
    switch (error) {
        case DecodeError::None: return "None";
        case DecodeError::UnrecognizedFormat: return "UnrecognizedFormat";
        case DecodeError::IdentifierMismatch: return "IdentifierMismatch";
        case DecodeError::PlatformUnsupported: return "PlatformUnsupported";
        case DecodeError::MissingKey: return "MissingKey";
        case DecodeError::InvalidKeyLength: return "InvalidKeyLength";
        case DecodeError::DecryptionFailed: return "DecryptionFailed";
        case DecodeError::NoServiceData: return "NoServiceData";
    }
    return "Unknown";
}

bool is_key_error(DecodeError error) {
    return error == DecodeError::MissingKey ||
           error == DecodeError::InvalidKeyLength ||
           error == DecodeError::DecryptionFailed;
}

void record_decode_outcome(DecodeFaultCounters& counters, DecodeError error) {
    switch (error) {
        case DecodeError::None: counters.decoded += 1; break;
        case DecodeError::UnrecognizedFormat: counters.unrecognized_format += 1; break;
        case DecodeError::IdentifierMismatch: counters.identifier_mismatch += 1; break;
        case DecodeError::PlatformUnsupported: counters.platform_unsupported += 1; break;
        case DecodeError::MissingKey: counters.missing_key += 1; break;
        case DecodeError::InvalidKeyLength: counters.invalid_key_length += 1; break;
        case DecodeError::DecryptionFailed: counters.decryption_failed += 1; break;
        case DecodeError::NoServiceData: counters.no_service_data += 1; break;
    }
    if (error != DecodeError::None) {
        counters.last_error = error;
    }
}

uint32_t total_decode_failures(const DecodeFaultCounters& counters) {
    return counters.unrecognized_format +
           counters.identifier_mismatch +
           counters.platform_unsupported +
           counters.missing_key +
           counters.invalid_key_length +
           counters.decryption_failed +
           counters.no_service_data;
}
