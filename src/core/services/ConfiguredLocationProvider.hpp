#pragma once

#include "ILocationProvider.hpp"

namespace bdf {

class IConfigService;

/// Position taken from location.latitude / location.longitude when
/// location.source is "static". Any other source reports no position.
class ConfiguredLocationProvider : public ILocationProvider {
public:
    explicit ConfiguredLocationProvider(IConfigService* config);

    std::optional<Coordinate> currentPosition() const override;
    double distanceBetween(const Coordinate& a, const Coordinate& b) const override;

    static double haversineMeters(const Coordinate& a, const Coordinate& b);

private:
    IConfigService* config_;
};

} // namespace bdf
