#include "ConfiguredLocationProvider.hpp"
#include "IConfigService.hpp"
#include <algorithm>
#include <cmath>

namespace bdf {

namespace {
constexpr double kEarthRadiusMeters = 6371000.0;
constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees)
{
    return degrees * kPi / 180.0;
}
}

ConfiguredLocationProvider::ConfiguredLocationProvider(IConfigService* config)
    : config_(config)
{
}

std::optional<Coordinate> ConfiguredLocationProvider::currentPosition() const
{
    if (!config_ || config_->value("location.source").toString() != QLatin1String("static"))
        return std::nullopt;

    Coordinate c;
    c.latitude = configDouble(config_, "location.latitude", 0.0);
    c.longitude = configDouble(config_, "location.longitude", 0.0);
    c.timestamp = QDateTime::currentDateTime();
    return c;
}

double ConfiguredLocationProvider::distanceBetween(const Coordinate& a, const Coordinate& b) const
{
    return haversineMeters(a, b);
}

double ConfiguredLocationProvider::haversineMeters(const Coordinate& a, const Coordinate& b)
{
    const double dLat = toRadians(b.latitude - a.latitude);
    const double dLon = toRadians(b.longitude - a.longitude);
    const double h = std::sin(dLat / 2) * std::sin(dLat / 2)
                   + std::cos(toRadians(a.latitude)) * std::cos(toRadians(b.latitude))
                   * std::sin(dLon / 2) * std::sin(dLon / 2);
    return 2.0 * kEarthRadiusMeters * std::asin(std::min(1.0, std::sqrt(h)));
}

} // namespace bdf
