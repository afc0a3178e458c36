#pragma once

#include "core/devices/Device.hpp"
#include <optional>

namespace bdf {

class ILocationProvider {
public:
    virtual ~ILocationProvider() = default;

    /// Last known position of this host, if any.
    virtual std::optional<Coordinate> currentPosition() const = 0;

    /// Great-circle distance in meters.
    virtual double distanceBetween(const Coordinate& a, const Coordinate& b) const = 0;
};

} // namespace bdf
