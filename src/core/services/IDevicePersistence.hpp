#pragma once

#include "core/devices/Device.hpp"
#include <QList>

namespace bdf {

/// Opaque storage for the saved (favorited) device list.
class IDevicePersistence {
public:
    virtual ~IDevicePersistence() = default;

    virtual QList<Device> loadSavedDevices() = 0;

    /// Replaces the stored list. Returns false if the write failed.
    virtual bool saveDevices(const QList<Device>& devices) = 0;
};

} // namespace bdf
