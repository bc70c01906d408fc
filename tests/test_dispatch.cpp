#include "atc_decode.hpp"
#include "session.hpp"
#include "wire_format.hpp"

#include <cassert>
#include <string>
#include <vector>

static Advertisement make_adv(const std::vector<uint8_t>& payload) {
    Advertisement adv{};
    adv.address = "A4:C1:38:8D:18:B2";
    adv.name = "ATC_8D18B2";
    adv.rssi = -71;
    adv.service_data[kEnvSensingServiceUuid] = payload;
    return adv;
}

static bool known_length(std::size_t len) {
    return len == 15 || len == 13 || len == 11 || len == 8;
}

static void test_format_table() {
    assert(wire_formats().size() == 4);
    assert(find_wire_format(15)->format == WireFormat::PvvxCustom && !find_wire_format(15)->encrypted);
    assert(find_wire_format(13)->format == WireFormat::Atc1441 && !find_wire_format(13)->encrypted);
    assert(find_wire_format(11)->format == WireFormat::PvvxEncrypted && find_wire_format(11)->encrypted);
    assert(find_wire_format(8)->format == WireFormat::Atc1441Encrypted && find_wire_format(8)->encrypted);
    assert(find_wire_format(14) == nullptr);
    assert(std::string(wire_format_info(WireFormat::Atc1441Encrypted).firmware) == "ATC (atc1441 encrypted)");
}

static void test_unknown_lengths_never_touch_the_session() {
    DecoderSession session(true, Bindkey(16, 0x33));
    for (std::size_t len = 0; len <= 40; ++len) {
        if (known_length(len)) {
            continue;
        }
        const std::vector<uint8_t> payload(len, 0x5A);
        const Advertisement adv = make_adv(payload);

        DecodeResult pure = decode_atc_payload(payload, adv, true, Bindkey(16, 0x33));
        assert(pure.error == DecodeError::UnrecognizedFormat);
        assert(pure.format == nullptr);
        assert(pure.measurements.values.empty());

        DecodeResult r = session.update(adv);
        assert(r.error == DecodeError::UnrecognizedFormat);
        assert(session.state() == SessionState::Unseen);
        assert(session.pending());
        assert(!session.is_encrypted());
        assert(!session.bindkey_verified());
        assert(!session.last_advertisement());
    }
    assert(session.faults().unrecognized_format == 41 - 4);
    assert(session.faults().decoded == 0);
    assert(session.faults().last_error == DecodeError::UnrecognizedFormat);
}

static void test_format_chosen_regardless_of_uuid() {
    const std::vector<uint8_t> payload{0xA4, 0xC1, 0x38, 0x8D, 0x18, 0xB2, 0x01, 0x12, 0x2F, 0x64, 0x0C, 0xA0, 0x25};
    Advertisement adv{};
    adv.address = "A4:C1:38:8D:18:B2";
    adv.name = "ATC_8D18B2";
    adv.rssi = -50;
    adv.service_data["0000fe95-0000-1000-8000-00805f9b34fb"] = payload;
    DecoderSession session(true);
    DecodeResult r = session.update(adv);
    assert(r.ok());
    assert(!session.pending());
}

static void test_empty_advertisement() {
    Advertisement adv{};
    adv.address = "A4:C1:38:8D:18:B2";
    DecoderSession session(true);
    DecodeResult r = session.update(adv);
    assert(r.error == DecodeError::NoServiceData);
    assert(session.pending());
    assert(session.faults().no_service_data == 1);
}

int main() {
    test_format_table();
    test_unknown_lengths_never_touch_the_session();
    test_format_chosen_regardless_of_uuid();
    test_empty_advertisement();
    return 0;
}
