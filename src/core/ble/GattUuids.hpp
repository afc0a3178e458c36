#pragma once

#include <QBluetoothUuid>

namespace bdf {
namespace ble {

/// Bluetooth SIG assigned numbers used by discovery, classification and the
/// GATT cascade. QBluetoothUuid expands 16-bit values onto the base UUID, so
/// comparisons work against full 128-bit strings reported by BlueZ.
namespace gatt {

// Services
inline QBluetoothUuid batteryService()           { return QBluetoothUuid(quint16(0x180F)); }
inline QBluetoothUuid immediateAlertService()    { return QBluetoothUuid(quint16(0x1802)); }
inline QBluetoothUuid alertNotificationService() { return QBluetoothUuid(quint16(0x1811)); }
inline QBluetoothUuid deviceInformationService() { return QBluetoothUuid(quint16(0x180A)); }
inline QBluetoothUuid humanInterfaceService()    { return QBluetoothUuid(quint16(0x1812)); }
inline QBluetoothUuid heartRateService()         { return QBluetoothUuid(quint16(0x180D)); }
inline QBluetoothUuid currentTimeService()       { return QBluetoothUuid(quint16(0x1805)); }
inline QBluetoothUuid audioSource()              { return QBluetoothUuid(quint16(0x110A)); }
inline QBluetoothUuid audioSink()                { return QBluetoothUuid(quint16(0x110B)); }
inline QBluetoothUuid remoteControlTarget()      { return QBluetoothUuid(quint16(0x110C)); }
inline QBluetoothUuid remoteControl()            { return QBluetoothUuid(quint16(0x110E)); }
inline QBluetoothUuid googleFastPair()           { return QBluetoothUuid(quint16(0xFE2C)); }

// Characteristics
inline QBluetoothUuid batteryLevel()             { return QBluetoothUuid(quint16(0x2A19)); }
inline QBluetoothUuid alertLevel()               { return QBluetoothUuid(quint16(0x2A06)); }
inline QBluetoothUuid newAlert()                 { return QBluetoothUuid(quint16(0x2A46)); }
inline QBluetoothUuid manufacturerNameString()   { return QBluetoothUuid(quint16(0x2A29)); }
inline QBluetoothUuid modelNumberString()        { return QBluetoothUuid(quint16(0x2A24)); }

// Company identifiers (manufacturer-specific data)
constexpr quint16 kAppleCompanyId = 0x004C;

/// Services the connection cascade descends into after enumeration.
inline bool isKnownCapability(const QBluetoothUuid& service)
{
    return service == batteryService()
        || service == immediateAlertService()
        || service == alertNotificationService()
        || service == deviceInformationService();
}

} // namespace gatt
} // namespace ble
} // namespace bdf
