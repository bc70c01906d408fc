#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

enum class MeasurementKind : uint8_t {
    Temperature = 1,  // degC
    Humidity,         // %RH
    Battery,          // %
    Voltage,          // V
    SignalStrength,   // dBm
};

struct DeviceInfo {
    std::string name;
    std::string manufacturer;
    std::string model;
    std::string sw_version;
};

// Fields the frame carries but that are not mapped to a measurement.
struct RawFrameFields {
    std::optional<uint8_t> packet_id;
    std::optional<uint8_t> trigger;
};

struct MeasurementSet {
    std::map<MeasurementKind, double> values;
    std::string firmware;
    std::string title;
    DeviceInfo device;
    RawFrameFields raw;

    void set(MeasurementKind kind, double value) { values[kind] = value; }
    bool has(MeasurementKind kind) const { return values.count(kind) != 0; }
    std::optional<double> get(MeasurementKind kind) const;
};

const char* measurement_name(MeasurementKind kind);
const char* measurement_unit(MeasurementKind kind);
