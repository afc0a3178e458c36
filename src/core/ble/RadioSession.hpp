#pragma once

#include "core/devices/Device.hpp"
#include <QBluetoothUuid>
#include <QByteArray>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>

namespace bdf {
namespace ble {

enum class RadioPowerState {
    Unknown,
    Unsupported,
    Unauthorized,
    PoweredOff,
    PoweredOn,
    Resetting
};

QString toString(RadioPowerState state);

enum class ScanMode {
    Broad,      // unfiltered, duplicates reported
    Narrow      // filtered to serviceUuids, duplicates suppressed
};

struct ScanFilter {
    ScanMode mode = ScanMode::Broad;
    QList<QBluetoothUuid> serviceUuids;
};

struct CharacteristicInfo {
    QBluetoothUuid uuid;
    bool canRead = false;
    bool canWrite = false;
    bool canWriteWithoutResponse = false;
    bool canNotify = false;
};

/// Abstract radio stack session. Implementations deliver every callback
/// as a signal on the thread that owns the session (the main event loop).
/// Peripherals are addressed by the stable device id carried in
/// Advertisement::identity.
class RadioSession : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    virtual ~RadioSession() = default;

    virtual RadioPowerState powerState() const = 0;

    /// Synthetic sessions have no real radio; callers skip power checks.
    virtual bool isSynthetic() const { return false; }

    /// Starts or reconfigures discovery.
    virtual void startDiscovery(const ScanFilter& filter) = 0;
    virtual void stopDiscovery() = 0;

    /// Answered exactly once by peripheralConnected or peripheralConnectFailed,
    /// even when cancelled first.
    virtual void connectPeripheral(const QString& id) = 0;

    /// Always answered by peripheralDisconnected, with or without error.
    virtual void cancelPeripheralConnection(const QString& id) = 0;

    virtual void discoverServices(const QString& id) = 0;
    virtual void discoverCharacteristics(const QString& id, const QBluetoothUuid& service) = 0;

    virtual void readCharacteristic(const QString& id, const QBluetoothUuid& service,
                                    const QBluetoothUuid& characteristic) = 0;
    virtual void writeCharacteristic(const QString& id, const QBluetoothUuid& service,
                                     const QBluetoothUuid& characteristic,
                                     const QByteArray& value, bool withResponse) = 0;
    virtual void setNotify(const QString& id, const QBluetoothUuid& service,
                           const QBluetoothUuid& characteristic, bool enabled) = 0;

    virtual void readRssi(const QString& id) = 0;

signals:
    void powerStateChanged(bdf::ble::RadioPowerState state);
    void advertisementReceived(const bdf::Advertisement& advertisement);

    void peripheralConnected(const QString& id, const QString& name);
    void peripheralConnectFailed(const QString& id, const QString& error);
    void peripheralDisconnected(const QString& id, const QString& error);

    void servicesDiscovered(const QString& id, const QList<QBluetoothUuid>& services);
    void serviceDiscoveryFailed(const QString& id, const QString& error);
    void characteristicsDiscovered(const QString& id, const QBluetoothUuid& service,
                                   const QList<bdf::ble::CharacteristicInfo>& characteristics);
    void characteristicValueUpdated(const QString& id, const QBluetoothUuid& service,
                                    const QBluetoothUuid& characteristic, const QByteArray& value);
    void characteristicError(const QString& id, const QBluetoothUuid& characteristic,
                             const QString& error);

    void rssiRead(const QString& id, int rssi);
};

} // namespace ble
} // namespace bdf

Q_DECLARE_METATYPE(bdf::ble::RadioPowerState)
Q_DECLARE_METATYPE(bdf::ble::CharacteristicInfo)
