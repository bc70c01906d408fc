#include <cstdio>
#include <string>
#include "config.hpp"
#include "hex.hpp"
#include "logging.hpp"
#include "session.hpp"

// Decodes a single captured service-data payload:
//   atc_ble_decode <address> <hex-payload> [name]
// Key and platform capability come from the ATC_BLE_* environment.
static int usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s <address> <hex-payload> [name]\n", argv0);
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        return usage(argv[0]);
    }

    init_logging();
    DecoderConfig cfg = load_config();
    set_log_level(cfg.log_level);

    Advertisement adv{};
    adv.address = argv[1];
    adv.name = argc == 4 ? argv[3] : "";
    adv.rssi = 0;
    std::vector<uint8_t> payload;
    if (!from_hex(argv[2], payload)) {
        log_error("MAIN", "payload '%s' is not hex", argv[2]);
        return usage(argv[0]);
    }
    adv.service_data[kEnvSensingServiceUuid] = payload;

    DecoderSession session(cfg);
    const DecodeResult result = session.update(adv);
    if (!result.ok()) {
        std::printf("%s: %s (state=%s)\n",
                    adv.address.c_str(),
                    decode_error_name(result.error),
                    session_state_name(session.state()));
        return 1;
    }

    const MeasurementSet& m = result.measurements;
    std::printf("%s\n  firmware: %s\n", m.title.c_str(), m.firmware.c_str());
    for (const auto& kv : m.values) {
        if (kv.first == MeasurementKind::SignalStrength) {
            continue; // not part of the captured payload
        }
        std::printf("  %s: %g %s\n", measurement_name(kv.first), kv.second, measurement_unit(kv.first));
    }
    if (result.encrypted()) {
        std::printf("  bindkey verified: %s\n", session.bindkey_verified() ? "yes" : "no");
    }
    return 0;
}
