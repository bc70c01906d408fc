#include "atc_decode.hpp"
#include "logging.hpp"

#include <cassert>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

static const char* kAddress = "A4:C1:38:8D:18:B2";

static Advertisement make_adv(const std::vector<uint8_t>& payload, const std::string& address = kAddress) {
    Advertisement adv{};
    adv.address = address;
    adv.name = "ATC_8D18B2";
    adv.rssi = -60;
    adv.service_data[kEnvSensingServiceUuid] = payload;
    return adv;
}

static bool near(std::optional<double> v, double expected, double eps = 1e-9) {
    return v && std::fabs(*v - expected) < eps;
}

static void put_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

static void put_u16_be(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

// Layout A as the pvvx firmware emits it.
static std::vector<uint8_t> pvvx_frame(const MacAddress& mac, double temp_c, double hum, double volt,
                                       uint8_t bat, uint8_t packet_id, uint8_t trg) {
    std::vector<uint8_t> out(mac.rbegin(), mac.rend());
    put_u16_le(out, static_cast<uint16_t>(static_cast<int16_t>(std::lround(temp_c * 100))));
    put_u16_le(out, static_cast<uint16_t>(std::lround(hum * 100)));
    put_u16_le(out, static_cast<uint16_t>(std::lround(volt * 1000)));
    out.push_back(bat);
    out.push_back(packet_id);
    out.push_back(trg);
    return out;
}

// Layout B as the atc1441 firmware emits it.
static std::vector<uint8_t> atc1441_frame(const MacAddress& mac, double temp_c, uint8_t hum,
                                          uint8_t bat, double volt, uint8_t packet_id) {
    std::vector<uint8_t> out(mac.begin(), mac.end());
    put_u16_be(out, static_cast<uint16_t>(static_cast<int16_t>(std::lround(temp_c * 10))));
    out.push_back(hum);
    out.push_back(bat);
    put_u16_be(out, static_cast<uint16_t>(std::lround(volt * 1000)));
    out.push_back(packet_id);
    return out;
}

static int g_debug_lines = 0;
static std::string g_last_line;

static void capture_sink(LogLevel level, const char* /*tag*/, const char* message) {
    if (level == LogLevel::Debug) {
        g_debug_lines++;
    }
    g_last_line = message;
}

static void test_atc1441_vector() {
    const std::vector<uint8_t> payload{0xA4, 0xC1, 0x38, 0x8D, 0x18, 0xB2, 0x01, 0x12, 0x2F, 0x64, 0x0C, 0xA0, 0x25};
    const Advertisement adv = make_adv(payload);
    DecodeResult r = decode_atc_payload(payload, adv, true, std::nullopt);
    assert(r.ok());
    assert(r.format != nullptr && r.format->format == WireFormat::Atc1441);
    assert(!r.encrypted());
    assert(!r.mac_from_payload);
    const MeasurementSet& m = r.measurements;
    assert(near(m.get(MeasurementKind::Temperature), 27.4));
    assert(near(m.get(MeasurementKind::Humidity), 47));
    assert(near(m.get(MeasurementKind::Battery), 100));
    assert(near(m.get(MeasurementKind::Voltage), 3.232));
    assert(near(m.get(MeasurementKind::SignalStrength), -60));
    assert(m.firmware == "ATC (atc1441)");
    assert(m.title == "ATC_8D18B2 (A4:C1:38:8D:18:B2)");
    assert(m.device.name == m.title);
    assert(m.device.manufacturer == "ATC");
    assert(m.device.model == "ATC sensor");
    assert(m.device.sw_version == "ATC (atc1441)");
    assert(m.raw.packet_id && *m.raw.packet_id == 0x25);
    assert(!m.raw.trigger);
}

static void test_pvvx_vector() {
    const std::vector<uint8_t> payload{0xB2, 0x18, 0x8D, 0x38, 0xC1, 0xA4, 0x59, 0x0A, 0xAD, 0x13, 0xB6, 0x09, 0x1F, 0x1E, 0x05};
    const Advertisement adv = make_adv(payload);
    DecodeResult r = decode_atc_payload(payload, adv, true, std::nullopt);
    assert(r.ok());
    assert(r.format->format == WireFormat::PvvxCustom);
    const MeasurementSet& m = r.measurements;
    assert(near(m.get(MeasurementKind::Temperature), 26.49));
    assert(near(m.get(MeasurementKind::Humidity), 50.37));
    assert(near(m.get(MeasurementKind::Battery), 31));
    assert(near(m.get(MeasurementKind::Voltage), 2.486));
    assert(m.firmware == "ATC (pvvx)");
    assert(m.title == "ATC_8D18B2 (A4:C1:38:8D:18:B2)");
    assert(*m.raw.packet_id == 0x1E);
    assert(*m.raw.trigger == 0x05);
    assert(format_mac_address(r.mac) == kAddress);
}

static void test_mac_mismatch_is_dropped_quietly() {
    const std::vector<uint8_t> payload{0xA4, 0xC1, 0x38, 0x8D, 0x18, 0xB2, 0x01, 0x12, 0x2F, 0x64, 0x0C, 0xA0, 0x25};
    const Advertisement adv = make_adv(payload, "A4:C1:38:8D:18:B3");

    g_debug_lines = 0;
    set_log_level(LogLevel::Debug);
    set_log_sink(capture_sink);
    DecodeResult r = decode_atc_payload(payload, adv, true, std::nullopt);
    set_log_sink(nullptr);
    set_log_level(LogLevel::Info);

    assert(r.error == DecodeError::IdentifierMismatch);
    assert(r.measurements.values.empty());
    assert(g_debug_lines >= 1);
    assert(g_last_line.find("doesn't match") != std::string::npos);

    // Same check for the reversed layout.
    const std::vector<uint8_t> pvvx{0xB2, 0x18, 0x8D, 0x38, 0xC1, 0xA4, 0x59, 0x0A, 0xAD, 0x13, 0xB6, 0x09, 0x1F, 0x1E, 0x05};
    r = decode_atc_payload(pvvx, make_adv(pvvx, "B2:18:8D:38:C1:A4"), true, std::nullopt);
    assert(r.error == DecodeError::IdentifierMismatch);
}

static void test_dash_and_lowercase_address() {
    const std::vector<uint8_t> payload{0xA4, 0xC1, 0x38, 0x8D, 0x18, 0xB2, 0x01, 0x12, 0x2F, 0x64, 0x0C, 0xA0, 0x25};
    const Advertisement adv = make_adv(payload, "a4-c1-38-8d-18-b2");
    DecodeResult r = decode_atc_payload(payload, adv, true, std::nullopt);
    assert(r.ok());
    assert(r.measurements.title == "ATC_8D18B2 (a4-c1-38-8d-18-b2)");
}

static void test_opaque_identifier_platform() {
    const char* opaque = "5E9B4E8A-7C1D-4C1D-9F3B-1D2E3F4A5B6C";
    const std::vector<uint8_t> payload{0xB2, 0x18, 0x8D, 0x38, 0xC1, 0xA4, 0x59, 0x0A, 0xAD, 0x13, 0xB6, 0x09, 0x1F, 0x1E, 0x05};
    const Advertisement adv = make_adv(payload, opaque);

    // The frame's own MAC is trusted when the host cannot see the real one.
    DecodeResult r = decode_atc_payload(payload, adv, false, std::nullopt);
    assert(r.ok());
    assert(r.mac_from_payload);
    assert(format_mac_address(r.mac) == kAddress);
    assert(r.measurements.title == std::string("ATC_8D18B2 (") + opaque + ")");

    // A host that claims to know MACs but hands over an opaque id cannot match.
    r = decode_atc_payload(payload, adv, true, std::nullopt);
    assert(r.error == DecodeError::IdentifierMismatch);
}

static void test_missing_name_uses_short_address() {
    const std::vector<uint8_t> payload{0xA4, 0xC1, 0x38, 0x8D, 0x18, 0xB2, 0x01, 0x12, 0x2F, 0x64, 0x0C, 0xA0, 0x25};
    Advertisement adv = make_adv(payload);
    adv.name.clear();
    DecodeResult r = decode_atc_payload(payload, adv, true, std::nullopt);
    assert(r.ok());
    assert(r.measurements.title == "ATC 18B2 (A4:C1:38:8D:18:B2)");
}

static void test_plaintext_roundtrip() {
    MacAddress mac{};
    bool ok = parse_mac_address(kAddress, mac);
    (void)ok;
    assert(ok);

    const std::vector<uint8_t> a = pvvx_frame(mac, -12.34, 99.99, 3.001, 87, 200, 0x02);
    assert(a.size() == kPvvxCustomLen);
    DecodeResult ra = decode_atc_payload(a, make_adv(a), true, std::nullopt);
    assert(ra.ok());
    assert(near(ra.measurements.get(MeasurementKind::Temperature), -12.34, 0.005));
    assert(near(ra.measurements.get(MeasurementKind::Humidity), 99.99, 0.005));
    assert(near(ra.measurements.get(MeasurementKind::Voltage), 3.001, 0.0005));
    assert(near(ra.measurements.get(MeasurementKind::Battery), 87));
    assert(*ra.measurements.raw.packet_id == 200);

    const std::vector<uint8_t> b = atc1441_frame(mac, -5.6, 63, 12, 2.9, 7);
    assert(b.size() == kAtc1441Len);
    DecodeResult rb = decode_atc_payload(b, make_adv(b), true, std::nullopt);
    assert(rb.ok());
    assert(near(rb.measurements.get(MeasurementKind::Temperature), -5.6, 0.05));
    assert(near(rb.measurements.get(MeasurementKind::Humidity), 63));
    assert(near(rb.measurements.get(MeasurementKind::Battery), 12));
    assert(near(rb.measurements.get(MeasurementKind::Voltage), 2.9, 0.0005));
    assert(rb.measurements.has(MeasurementKind::SignalStrength));
}

int main() {
    test_atc1441_vector();
    test_pvvx_vector();
    test_mac_mismatch_is_dropped_quietly();
    test_dash_and_lowercase_address();
    test_opaque_identifier_platform();
    test_missing_name_uses_short_address();
    test_plaintext_roundtrip();
    return 0;
}
