#pragma once

#include "core/devices/Device.hpp"
#include <QString>
#include <optional>

namespace bdf {
namespace proximity {

/// Log-distance path-loss calibration.
struct Calibration {
    int referencePower = -59;          // expected RSSI at 1 meter
    double pathLossExponent = 2.5;     // 2.0 open space, 2.5-4 indoors
    double fallbackDistance = 30.0;    // meters, returned when RSSI is unavailable
};

/// BlueZ omits RSSI when unknown; CoreBluetooth-style stacks report 127.
/// Non-negative readings are treated as unavailable.
bool isUsableRssi(std::optional<int> rssi);

/// Bucket thresholds: > -50 excellent, > -65 good, > -80 fair, otherwise poor.
SignalQuality qualityFor(std::optional<int> rssi);

/// distance = 10 ^ ((referencePower - rssi) / (10 * n)).
/// Always finite and positive; falls back to calibration.fallbackDistance.
double estimateDistance(std::optional<int> rssi, const Calibration& calibration = {});

/// Short human-readable label for a bucket ("Very close" ... "Far away").
/// Empty for Unknown.
QString describe(SignalQuality quality);

} // namespace proximity
} // namespace bdf
