#pragma once

#include "advertisement.hpp"
#include "atc_crypto.hpp"
#include "fault.hpp"
#include "measurements.hpp"
#include "wire_format.hpp"

#include <optional>
#include <vector>

struct DecodeResult {
    DecodeError error;
    // nullptr when the payload length matched no known format.
    const WireFormatInfo* format;
    // MAC the frame was attributed to; valid when `error` is None.
    MacAddress mac;
    // The MAC was taken from the frame because the transport cannot supply it.
    bool mac_from_payload;
    MeasurementSet measurements;

    bool ok() const { return error == DecodeError::None; }
    bool encrypted() const { return format != nullptr && format->encrypted; }
};

// Decodes one service-data payload. Pure apart from logging: the format is
// chosen by payload length, the MAC is reconciled against `adv.address`
// (or taken from the frame when `identifier_trusted_from_transport` is
// false), and encrypted formats are verified with `bindkey`.
DecodeResult decode_atc_payload(const std::vector<uint8_t>& payload,
                                const Advertisement& adv,
                                bool identifier_trusted_from_transport,
                                const std::optional<Bindkey>& bindkey);

// "{name} ({address})", with "ATC <short address>" standing in for a
// missing local name.
std::string device_title(const Advertisement& adv);
