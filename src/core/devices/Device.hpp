#pragma once

#include <QBluetoothUuid>
#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <cstdint>
#include <optional>

namespace bdf {

enum class DeviceCategory {
    Headphones,
    Speaker,
    Watch,
    Phone,
    Tablet,
    Laptop,
    Computer,
    Keyboard,
    Mouse,
    Unknown
};

enum class SignalQuality {
    Excellent,
    Good,
    Fair,
    Poor,
    Unknown
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    ServiceDiscovery,
    Ready,
    Failed,
    Disconnecting
};

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
    QDateTime timestamp;
};

/// Side-channel data broadcast with a discovery event.
struct AdvertisementData {
    QString localName;                          // empty when the peripheral advertises none
    QList<QBluetoothUuid> serviceUuids;
    QMap<quint16, QByteArray> manufacturerData; // company id -> payload
    QMap<QBluetoothUuid, QByteArray> serviceData;
    std::optional<int> txPower;
};

/// One observed advertisement, normalised by the radio session.
struct Advertisement {
    QString identity;   // stable id: BlueZ address, or a generated UUID for synthetic devices
    QString handle;     // radio session object key (BlueZ object path); empty for synthetic
    std::optional<int> rssi;
    AdvertisementData data;
};

/// Canonical record for one physical peripheral. Owned by DeviceRegistry;
/// everything outside the registry sees copies.
struct Device {
    QString id;
    QString name;
    DeviceCategory category = DeviceCategory::Unknown;

    std::optional<int> rssi;
    SignalQuality signalQuality = SignalQuality::Unknown;
    double estimatedDistance = 0.0;   // meters

    QDateTime lastSeen;
    std::optional<int> batteryLevel;
    ConnectionState connectionState = ConnectionState::Disconnected;
    bool isSaved = false;
    std::optional<Coordinate> location;
    QDateTime foundAt;

    QString handle;
    QString manufacturerName;
    QString modelNumber;

    bool isConnected() const
    {
        return connectionState == ConnectionState::Connected
            || connectionState == ConnectionState::ServiceDiscovery
            || connectionState == ConnectionState::Ready;
    }
};

QString toString(DeviceCategory category);
QString toString(SignalQuality quality);
QString toString(ConnectionState state);

/// Inverse of toString(DeviceCategory); unrecognised strings map to Unknown.
DeviceCategory categoryFromString(const QString& value);

} // namespace bdf

Q_DECLARE_METATYPE(bdf::Device)
Q_DECLARE_METATYPE(bdf::Advertisement)
Q_DECLARE_METATYPE(bdf::ConnectionState)
Q_DECLARE_METATYPE(bdf::DeviceCategory)
