#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

constexpr std::size_t kMacLength = 6;
constexpr const char* kEnvSensingServiceUuid = "0000181a-0000-1000-8000-00805f9b34fb";

using MacAddress = std::array<uint8_t, kMacLength>;

// One scan event as handed over by the BLE stack. `address` is either a
// "AA:BB:CC:DD:EE:FF" / "AA-BB-..." MAC or, on stacks that hide the MAC,
// an opaque per-host identifier.
struct Advertisement {
    std::string address;
    std::string name;
    int16_t rssi;
    std::map<std::string, std::vector<uint8_t>> service_data;
};

bool parse_mac_address(const std::string& text, MacAddress& out);
std::string format_mac_address(const MacAddress& mac);
MacAddress reversed_mac(const MacAddress& mac);

// "A4:C1:38:8D:18:B2" -> "18B2"; opaque identifiers yield their last
// dash-separated group, upper-cased.
std::string short_address(const std::string& address);
