#include "atc_decode.hpp"
#include "logging.hpp"

#include <algorithm>

namespace {
constexpr const char* kTag = "ATC";
constexpr const char* kManufacturer = "ATC";
constexpr const char* kModel = "ATC sensor";
constexpr uint8_t kBatteryMax = 100;

// Bounds-checked cursor over a fixed-layout frame.
struct FrameReader {
    const uint8_t* data;
    std::size_t len;
    std::size_t idx = 0;

    bool read_u8(uint8_t& out) {
        if (idx + 1 > len) return false;
        out = data[idx++];
        return true;
    }
    bool read_u16_le(uint16_t& out) {
        if (idx + 2 > len) return false;
        out = static_cast<uint16_t>(data[idx] | (data[idx + 1] << 8));
        idx += 2;
        return true;
    }
    bool read_u16_be(uint16_t& out) {
        if (idx + 2 > len) return false;
        out = static_cast<uint16_t>((data[idx] << 8) | data[idx + 1]);
        idx += 2;
        return true;
    }
    bool read_i16_le(int16_t& out) {
        uint16_t raw = 0;
        if (!read_u16_le(raw)) return false;
        out = static_cast<int16_t>(raw);
        return true;
    }
    bool read_i16_be(int16_t& out) {
        uint16_t raw = 0;
        if (!read_u16_be(raw)) return false;
        out = static_cast<int16_t>(raw);
        return true;
    }
    bool read_mac(MacAddress& out) {
        if (idx + kMacLength > len) return false;
        std::copy(data + idx, data + idx + kMacLength, out.begin());
        idx += kMacLength;
        return true;
    }
};

DecodeError reconcile_embedded_mac(const MacAddress& embedded,
                                   const Advertisement& adv,
                                   bool identifier_trusted_from_transport,
                                   DecodeResult& out) {
    if (!identifier_trusted_from_transport) {
        // The host only reports an opaque identifier; the frame is the sole
        // source of the MAC.
        out.mac = embedded;
        out.mac_from_payload = true;
        return DecodeError::None;
    }
    MacAddress source{};
    if (!parse_mac_address(adv.address, source)) {
        log_debug(kTag, "Transport address '%s' is not a MAC, expected %s",
                  adv.address.c_str(), format_mac_address(embedded).c_str());
        return DecodeError::IdentifierMismatch;
    }
    if (source != embedded) {
        log_debug(kTag, "MAC address doesn't match data frame. Expected: %s, Got: %s",
                  format_mac_address(embedded).c_str(), format_mac_address(source).c_str());
        return DecodeError::IdentifierMismatch;
    }
    out.mac = source;
    return DecodeError::None;
}

DecodeError resolve_transport_mac(const Advertisement& adv,
                                  bool identifier_trusted_from_transport,
                                  const WireFormatInfo& info,
                                  DecodeResult& out) {
    if (!identifier_trusted_from_transport) {
        log_warn(kTag, "Encrypted %s format is not supported on this platform, "
                 "use another advertising format", info.firmware);
        return DecodeError::PlatformUnsupported;
    }
    if (!parse_mac_address(adv.address, out.mac)) {
        log_warn(kTag, "Encrypted %s format needs the device MAC, got '%s'",
                 info.firmware, adv.address.c_str());
        return DecodeError::PlatformUnsupported;
    }
    return DecodeError::None;
}

// [mac reversed:6][temp i16 LE /100][hum u16 LE /100][volt u16 LE /1000][batt u8][packet u8][trg u8]
DecodeError decode_pvvx_custom(const std::vector<uint8_t>& payload,
                               const Advertisement& adv,
                               bool identifier_trusted_from_transport,
                               DecodeResult& out) {
    FrameReader r{payload.data(), payload.size()};
    MacAddress mac_reversed{};
    int16_t temp = 0;
    uint16_t hum = 0, volt = 0;
    uint8_t bat = 0, packet_id = 0, trg = 0;
    if (!r.read_mac(mac_reversed) || !r.read_i16_le(temp) || !r.read_u16_le(hum) ||
        !r.read_u16_le(volt) || !r.read_u8(bat) || !r.read_u8(packet_id) || !r.read_u8(trg)) {
        return DecodeError::UnrecognizedFormat;
    }

    const DecodeError err = reconcile_embedded_mac(reversed_mac(mac_reversed), adv,
                                                   identifier_trusted_from_transport, out);
    if (err != DecodeError::None) {
        return err;
    }

    MeasurementSet& m = out.measurements;
    m.set(MeasurementKind::Temperature, temp / 100.0);
    m.set(MeasurementKind::Humidity, hum / 100.0);
    m.set(MeasurementKind::Voltage, volt / 1000.0);
    m.set(MeasurementKind::Battery, bat);
    m.raw.packet_id = packet_id;
    m.raw.trigger = trg;
    return DecodeError::None;
}

// [mac:6][temp i16 BE /10][hum u8][batt u8][volt u16 BE /1000][packet u8]
DecodeError decode_atc1441(const std::vector<uint8_t>& payload,
                           const Advertisement& adv,
                           bool identifier_trusted_from_transport,
                           DecodeResult& out) {
    FrameReader r{payload.data(), payload.size()};
    MacAddress mac{};
    int16_t temp = 0;
    uint8_t hum = 0, bat = 0, packet_id = 0;
    uint16_t volt = 0;
    if (!r.read_mac(mac) || !r.read_i16_be(temp) || !r.read_u8(hum) || !r.read_u8(bat) ||
        !r.read_u16_be(volt) || !r.read_u8(packet_id)) {
        return DecodeError::UnrecognizedFormat;
    }

    const DecodeError err = reconcile_embedded_mac(mac, adv, identifier_trusted_from_transport, out);
    if (err != DecodeError::None) {
        return err;
    }

    MeasurementSet& m = out.measurements;
    m.set(MeasurementKind::Temperature, temp / 10.0);
    m.set(MeasurementKind::Humidity, hum);
    m.set(MeasurementKind::Voltage, volt / 1000.0);
    m.set(MeasurementKind::Battery, bat);
    m.raw.packet_id = packet_id;
    return DecodeError::None;
}

// Plaintext: [temp i16 LE /100][hum u16 LE /100][batt u8][trg u8]
DecodeError decode_pvvx_encrypted(const std::vector<uint8_t>& payload,
                                  const Advertisement& adv,
                                  bool identifier_trusted_from_transport,
                                  const std::optional<Bindkey>& bindkey,
                                  DecodeResult& out) {
    DecodeError err = resolve_transport_mac(adv, identifier_trusted_from_transport, *out.format, out);
    if (err != DecodeError::None) {
        return err;
    }
    std::vector<uint8_t> clear;
    err = decrypt_atc_payload(payload, out.mac, bindkey, clear);
    if (err != DecodeError::None) {
        return err;
    }

    FrameReader r{clear.data(), clear.size()};
    int16_t temp = 0;
    uint16_t hum = 0;
    uint8_t bat = 0, trg = 0;
    if (!r.read_i16_le(temp) || !r.read_u16_le(hum) || !r.read_u8(bat) || !r.read_u8(trg)) {
        return DecodeError::DecryptionFailed;
    }

    MeasurementSet& m = out.measurements;
    m.set(MeasurementKind::Temperature, temp / 100.0);
    m.set(MeasurementKind::Humidity, hum / 100.0);
    m.set(MeasurementKind::Battery, bat);
    m.raw.trigger = trg;
    return DecodeError::None;
}

// Plaintext: [temp u8: /2 - 40][hum u8: /2][trg:1 | batt:7]
DecodeError decode_atc1441_encrypted(const std::vector<uint8_t>& payload,
                                     const Advertisement& adv,
                                     bool identifier_trusted_from_transport,
                                     const std::optional<Bindkey>& bindkey,
                                     DecodeResult& out) {
    DecodeError err = resolve_transport_mac(adv, identifier_trusted_from_transport, *out.format, out);
    if (err != DecodeError::None) {
        return err;
    }
    std::vector<uint8_t> clear;
    err = decrypt_atc_payload(payload, out.mac, bindkey, clear);
    if (err != DecodeError::None) {
        return err;
    }

    FrameReader r{clear.data(), clear.size()};
    uint8_t temp = 0, hum = 0, packed = 0;
    if (!r.read_u8(temp) || !r.read_u8(hum) || !r.read_u8(packed)) {
        return DecodeError::DecryptionFailed;
    }
    // Some firmware builds report up to 127 here.
    const uint8_t bat = std::min<uint8_t>(static_cast<uint8_t>(packed & 0x7F), kBatteryMax);

    MeasurementSet& m = out.measurements;
    m.set(MeasurementKind::Temperature, temp / 2.0 - 40.0);
    m.set(MeasurementKind::Humidity, hum / 2.0);
    m.set(MeasurementKind::Battery, bat);
    m.raw.trigger = static_cast<uint8_t>(packed >> 7);
    return DecodeError::None;
}

void finish_measurements(const Advertisement& adv, DecodeResult& out) {
    MeasurementSet& m = out.measurements;
    m.set(MeasurementKind::SignalStrength, adv.rssi);
    m.firmware = out.format->firmware;
    m.title = device_title(adv);
    m.device.name = m.title;
    m.device.manufacturer = kManufacturer;
    m.device.model = kModel;
    m.device.sw_version = m.firmware;
}
} // namespace

std::string device_title(const Advertisement& adv) {
    const std::string name = adv.name.empty() ? "ATC " + short_address(adv.address) : adv.name;
    return name + " (" + adv.address + ")";
}

DecodeResult decode_atc_payload(const std::vector<uint8_t>& payload,
                                const Advertisement& adv,
                                bool identifier_trusted_from_transport,
                                const std::optional<Bindkey>& bindkey) {
    DecodeResult out{};
    out.format = find_wire_format(payload.size());
    if (out.format == nullptr) {
        log_debug("DISPATCH", "Ignoring %zu byte payload from %s: unknown format",
                  payload.size(), adv.address.c_str());
        out.error = DecodeError::UnrecognizedFormat;
        return out;
    }

    switch (out.format->format) {
        case WireFormat::PvvxCustom:
            out.error = decode_pvvx_custom(payload, adv, identifier_trusted_from_transport, out);
            break;
        case WireFormat::Atc1441:
            out.error = decode_atc1441(payload, adv, identifier_trusted_from_transport, out);
            break;
        case WireFormat::PvvxEncrypted:
            out.error = decode_pvvx_encrypted(payload, adv, identifier_trusted_from_transport, bindkey, out);
            break;
        case WireFormat::Atc1441Encrypted:
            out.error = decode_atc1441_encrypted(payload, adv, identifier_trusted_from_transport, bindkey, out);
            break;
    }

    if (out.error != DecodeError::None) {
        out.measurements = MeasurementSet{};
        return out;
    }
    finish_measurements(adv, out);
    return out;
}
