#pragma once

#include "core/ble/RadioSession.hpp"
#include <QObject>
#include <QTimer>

namespace bdf {

class DeviceRegistry;
class INotificationService;
class IConfigService;

namespace ble {

struct ScanSession {
    bool active = false;
    RadioPowerState radioPowerState = RadioPowerState::Unknown;
};

/// Owns the discovery half of the radio session: starts and stops scans,
/// tracks power state and forwards advertisements to the registry.
class ScanController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool scanning READ isScanning NOTIFY scanningChanged)

public:
    ScanController(RadioSession* radio, DeviceRegistry* registry,
                   INotificationService* notifications, IConfigService* config,
                   QObject* parent = nullptr);

    void startScanning();
    void stopScanning();

    bool isScanning() const { return session_.active; }
    ScanSession session() const { return session_; }
    RadioPowerState powerState() const { return session_.radioPowerState; }

signals:
    void scanningChanged(bool scanning);
    void powerStateChanged(bdf::ble::RadioPowerState state);

private slots:
    void onPowerStateChanged(bdf::ble::RadioPowerState state);
    void onAdvertisement(const bdf::Advertisement& advertisement);
    void onWarmupElapsed();

private:
    void reportUnavailable(RadioPowerState state);
    QList<QBluetoothUuid> serviceFilter() const;

    RadioSession* radio_;
    DeviceRegistry* registry_;
    INotificationService* notifications_;
    IConfigService* config_;

    ScanSession session_;
    QTimer warmupTimer_;
    QTimer durationTimer_;
};

} // namespace ble
} // namespace bdf
