#pragma once

#include "core/devices/Device.hpp"
#include <QString>
#include <functional>
#include <optional>
#include <vector>

namespace bdf {

/// Heuristic device-type classification from advertisement metadata and name.
///
/// Classification is an ordered pipeline of pure matchers; the first matcher
/// that returns a category wins, otherwise the result is Unknown:
///   1. advertised service UUIDs
///   2. manufacturer-specific data
///   3. name keywords (case-insensitive)
class DeviceClassifier {
public:
    using Matcher = std::function<std::optional<DeviceCategory>(const AdvertisementData& data,
                                                                const QString& name)>;

    struct Stage {
        QString name;
        Matcher match;
    };

    /// Builds the default pipeline.
    DeviceClassifier();

    /// Builds a classifier over a custom pipeline (tests, extensions).
    explicit DeviceClassifier(std::vector<Stage> stages);

    DeviceCategory classify(const AdvertisementData& data, const QString& name) const;

    const std::vector<Stage>& stages() const { return stages_; }

    static std::optional<DeviceCategory> matchServiceUuids(const AdvertisementData& data,
                                                           const QString& name);
    static std::optional<DeviceCategory> matchManufacturerData(const AdvertisementData& data,
                                                               const QString& name);
    static std::optional<DeviceCategory> matchNameKeywords(const AdvertisementData& data,
                                                           const QString& name);

private:
    std::vector<Stage> stages_;
};

} // namespace bdf
