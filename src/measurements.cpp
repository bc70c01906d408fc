#include "measurements.hpp"

std::optional<double> MeasurementSet::get(MeasurementKind kind) const {
    const auto it = values.find(kind);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* measurement_name(MeasurementKind kind) {
    switch (kind) {
        case MeasurementKind::Temperature: return "temperature";
        case MeasurementKind::Humidity: return "humidity";
        case MeasurementKind::Battery: return "battery";
        case MeasurementKind::Voltage: return "voltage";
        case MeasurementKind::SignalStrength: return "signal_strength";
    }
    return "unknown";
}

const char* measurement_unit(MeasurementKind kind) {
    switch (kind) {
        case MeasurementKind::Temperature: return "\xC2\xB0" "C";
        case MeasurementKind::Humidity: return "%";
        case MeasurementKind::Battery: return "%";
        case MeasurementKind::Voltage: return "V";
        case MeasurementKind::SignalStrength: return "dBm";
    }
    return "";
}
