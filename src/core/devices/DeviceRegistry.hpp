#pragma once

#include "core/devices/Device.hpp"
#include "core/devices/DeviceClassifier.hpp"
#include "core/devices/ProximityEstimator.hpp"
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <optional>

namespace bdf {

class INotificationService;
class ILocationProvider;
class IDevicePersistence;

/// Single source of truth for observed devices, keyed by stable id.
///
/// Mutations are serialized under a mutex; every read and every signal
/// carries a copy, so observers never see a half-written record.
class DeviceRegistry : public QObject {
    Q_OBJECT
public:
    enum class SortOrder {
        ByName,
        BySignalStrength,
        ByLastSeen
    };

    static const QString kPlaceholderName;

    DeviceRegistry(INotificationService* notifications,
                   ILocationProvider* location,
                   IDevicePersistence* persistence,
                   const proximity::Calibration& calibration = {},
                   QObject* parent = nullptr);

    /// Creates or updates the record for advertisement.identity.
    Device upsertFromDiscovery(const Advertisement& advertisement);

    std::optional<Device> markConnectionState(const QString& id, ConnectionState state);
    void applyBatteryLevel(const QString& id, int percent);
    void applyDeviceInformation(const QString& id, const QString& manufacturer, const QString& model);
    void updateSignalStrength(const QString& id, int rssi);

    /// Returns the new saved flag, or nullopt if the id is unknown.
    std::optional<bool> toggleSaved(const QString& id);
    bool remove(const QString& id);

    /// Records the current position and lastSeen without touching
    /// connection or saved state.
    void markFound(const QString& id);

    /// Stamps the current position. Posts LocationUnavailable when the
    /// provider has none.
    bool refreshLocation(const QString& id);

    /// Meters between this host and the device's last known location.
    std::optional<double> geographicDistanceTo(const QString& id) const;

    /// Returns the existing record, or creates a minimal one.
    Device ensureDevice(const QString& id, const QString& name);

    /// Merges the persisted saved list into the registry. Returns the number
    /// of records loaded.
    int loadSaved();

    /// A saved record with this exact name under another id. Placeholder
    /// names never match.
    std::optional<Device> savedDeviceNamed(const QString& name, const QString& excludeId) const;

    std::optional<Device> device(const QString& id) const;
    bool contains(const QString& id) const;
    int count() const;
    QList<Device> devices(SortOrder order = SortOrder::ByName) const;

    const proximity::Calibration& calibration() const { return calibration_; }

signals:
    void deviceAdded(const bdf::Device& device);
    void deviceUpdated(const bdf::Device& device);
    void deviceRemoved(const QString& id);
    /// Emitted for every applied advertisement, new or known.
    void deviceDiscovered(const bdf::Device& device);

private:
    void persistSaved();
    std::optional<Coordinate> currentPosition() const;

    INotificationService* notifications_;
    ILocationProvider* location_;
    IDevicePersistence* persistence_;
    proximity::Calibration calibration_;
    DeviceClassifier classifier_;

    mutable QMutex mutex_;
    QHash<QString, Device> devices_;
};

} // namespace bdf
