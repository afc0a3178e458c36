#include "core/devices/ProximityEstimator.hpp"
#include <cmath>

namespace bdf {
namespace proximity {

namespace {
constexpr int kUnavailableRssi = 127;
constexpr int kExcellentAbove = -50;
constexpr int kGoodAbove = -65;
constexpr int kFairAbove = -80;
}

bool isUsableRssi(std::optional<int> rssi)
{
    return rssi.has_value() && *rssi != kUnavailableRssi && *rssi < 0;
}

SignalQuality qualityFor(std::optional<int> rssi)
{
    if (!isUsableRssi(rssi))
        return SignalQuality::Unknown;

    if (*rssi > kExcellentAbove) return SignalQuality::Excellent;
    if (*rssi > kGoodAbove) return SignalQuality::Good;
    if (*rssi > kFairAbove) return SignalQuality::Fair;
    return SignalQuality::Poor;
}

double estimateDistance(std::optional<int> rssi, const Calibration& calibration)
{
    if (!isUsableRssi(rssi) || calibration.pathLossExponent <= 0.0)
        return calibration.fallbackDistance;

    const double exponent = static_cast<double>(calibration.referencePower - *rssi)
                          / (10.0 * calibration.pathLossExponent);
    const double distance = std::pow(10.0, exponent);
    if (!std::isfinite(distance) || distance <= 0.0)
        return calibration.fallbackDistance;
    return distance;
}

QString describe(SignalQuality quality)
{
    switch (quality) {
    case SignalQuality::Excellent: return QStringLiteral("Very close");
    case SignalQuality::Good:      return QStringLiteral("Close");
    case SignalQuality::Fair:      return QStringLiteral("Nearby");
    case SignalQuality::Poor:      return QStringLiteral("Far away");
    case SignalQuality::Unknown:   break;
    }
    return {};
}

} // namespace proximity
} // namespace bdf
