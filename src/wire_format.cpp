#include "wire_format.hpp"

namespace {
constexpr std::array<WireFormatInfo, kWireFormatCount> kFormats{{
    {WireFormat::PvvxCustom, kPvvxCustomLen, false, "ATC (pvvx)"},
    {WireFormat::Atc1441, kAtc1441Len, false, "ATC (atc1441)"},
    {WireFormat::PvvxEncrypted, kPvvxEncryptedLen, true, "ATC (pvvx encrypted)"},
    {WireFormat::Atc1441Encrypted, kAtc1441EncryptedLen, true, "ATC (atc1441 encrypted)"},
}};
} // namespace

const std::array<WireFormatInfo, kWireFormatCount>& wire_formats() {
    return kFormats;
}

const WireFormatInfo* find_wire_format(std::size_t payload_len) {
    for (const WireFormatInfo& info : kFormats) {
        if (info.payload_len == payload_len) {
            return &info;
        }
    }
    return nullptr;
}

const WireFormatInfo& wire_format_info(WireFormat format) {
    for (const WireFormatInfo& info : kFormats) {
        if (info.format == format) {
            return info;
        }
    }
    return kFormats[0];
}
