#pragma once

#include "core/ble/RadioSession.hpp"
#include <QDBusMessage>
#include <QHash>
#include <QSet>
#include <QTimer>
#include <QVariantMap>
#include <functional>
#include <map>
#include <memory>
#include <optional>

class QDBusArgument;
class QDBusServiceWatcher;

namespace bdf {

class IConfigService;

namespace ble {

/// RadioSession over BlueZ on the system bus.
///
/// Device identity is the BlueZ Address property; the Device1 object path is
/// the handle. Every D-Bus call that can take time is issued asynchronously
/// and answered through QDBusPendingCallWatcher on the main loop.
class BluezRadioSession : public RadioSession {
    Q_OBJECT
public:
    /// interface name -> properties
    using InterfaceMap = QMap<QString, QVariantMap>;
    /// object path -> interfaces
    using ManagedObjects = QMap<QString, InterfaceMap>;

    explicit BluezRadioSession(IConfigService* config, QObject* parent = nullptr);
    ~BluezRadioSession() override;

    /// Locates the adapter and subscribes to BlueZ signals.
    /// Leaves powerState() at Unsupported when no adapter is present.
    void initialize();

    QString adapterPath() const { return adapterPath_; }

    RadioPowerState powerState() const override { return powerState_; }
    void startDiscovery(const ScanFilter& filter) override;
    void stopDiscovery() override;
    void connectPeripheral(const QString& id) override;
    void cancelPeripheralConnection(const QString& id) override;
    void discoverServices(const QString& id) override;
    void discoverCharacteristics(const QString& id, const QBluetoothUuid& service) override;
    void readCharacteristic(const QString& id, const QBluetoothUuid& service,
                            const QBluetoothUuid& characteristic) override;
    void writeCharacteristic(const QString& id, const QBluetoothUuid& service,
                             const QBluetoothUuid& characteristic,
                             const QByteArray& value, bool withResponse) override;
    void setNotify(const QString& id, const QBluetoothUuid& service,
                   const QBluetoothUuid& characteristic, bool enabled) override;
    void readRssi(const QString& id) override;

    // Parsing helpers, exposed for tests.
    static Advertisement advertisementFromProperties(const QString& path, const QVariantMap& props);
    static QMap<quint16, QByteArray> parseManufacturerData(const QVariant& value);
    static QMap<QBluetoothUuid, QByteArray> parseServiceData(const QVariant& value);
    static QList<QBluetoothUuid> parseUuids(const QStringList& uuids);
    static CharacteristicInfo characteristicFromFlags(const QBluetoothUuid& uuid, const QStringList& flags);
    static RadioPowerState powerStateFromAdapter(const QVariantMap& adapterProps);
    static std::optional<RadioPowerState> powerStateForError(const QString& dbusErrorName);
    static QVariantMap discoveryFilterFor(const ScanFilter& filter);
    static QString addressFromPath(const QString& devicePath);

private slots:
    void onPropertiesChanged(const QString& interface, const QVariantMap& changed,
                             const QStringList& invalidated, const QDBusMessage& msg);
    void onInterfacesAdded(const QDBusMessage& msg);
    void onInterfacesRemoved(const QDBusMessage& msg);

private:
    struct GattCharacteristic {
        QString path;
        QBluetoothUuid service;
        CharacteristicInfo info;
    };

    struct GattTable {
        QMap<QBluetoothUuid, QString> servicePaths;
        QList<GattCharacteristic> characteristics;
    };

    struct DeviceEntry {
        Advertisement advertisement;
        QString name;
        bool connected = false;
        bool servicesResolved = false;
    };

    static InterfaceMap readInterfaces(const QDBusArgument& arg);
    static void mergeDeviceProperties(DeviceEntry& entry, const QVariantMap& props);
    ManagedObjects managedObjects() const;

    void setPowerState(RadioPowerState state);
    void handleDbusError(const QString& context, const QString& errorName, const QString& message);
    void updateDevice(const QString& path, const QVariantMap& props, bool announce);
    void onServicesResolved(const QString& id);
    void enumerateGatt(const QString& id);
    const GattCharacteristic* findCharacteristic(const QString& id, const QBluetoothUuid& service,
                                                 const QBluetoothUuid& characteristic) const;
    QString pathFor(const QString& id) const;
    QString nameFor(const QString& id) const;
    void emitDeferred(std::function<void()> fn);

    IConfigService* config_;
    QDBusServiceWatcher* serviceWatcher_ = nullptr;
    QString adapterPath_;
    RadioPowerState powerState_ = RadioPowerState::Unknown;
    bool discovering_ = false;
    ScanFilter filter_;

    QHash<QString, DeviceEntry> devices_;       // Device1 path -> cached state
    QHash<QString, QString> pathByAddress_;
    QSet<QString> pendingConnects_;
    QSet<QString> connected_;
    QHash<QString, GattTable> gatt_;            // device id -> resolved GATT objects
    std::map<QString, std::unique_ptr<QTimer>> resolveTimers_;
};

} // namespace ble
} // namespace bdf
