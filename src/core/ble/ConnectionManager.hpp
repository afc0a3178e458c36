#pragma once

#include "core/ble/RadioSession.hpp"
#include "core/services/INotificationService.hpp"
#include <QDateTime>
#include <QHash>
#include <QMap>
#include <QObject>
#include <QSet>
#include <QTimer>
#include <map>
#include <memory>

namespace bdf {

class DeviceRegistry;
class IConfigService;

namespace ble {

/// Per-device connection state machine.
///
///   Disconnected -> Connecting -> Connected -> ServiceDiscovery -> Ready
///   Connecting -> Failed -> Disconnected
///   {Connected, ServiceDiscovery, Ready} -> Disconnecting -> Disconnected
///
/// State lives in the DeviceRegistry record; this class owns the timers and
/// the per-link GATT bookkeeping.
class ConnectionManager : public QObject {
    Q_OBJECT
public:
    enum class SignalKind {
        Sound,
        Vibrate
    };

    ConnectionManager(RadioSession* radio, DeviceRegistry* registry,
                      INotificationService* notifications, IConfigService* config,
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    void connectDevice(const QString& id);
    void disconnectDevice(const QString& id);

    /// Returns false (and posts NotConnected) when the device has no link.
    bool readBatteryLevel(const QString& id);
    bool sendSignal(const QString& id, SignalKind kind);

    bool hasPendingAttempt(const QString& id) const;
    int pendingAttemptCount() const { return static_cast<int>(attempts_.size()); }
    int serviceDiscoveryAttempts(const QString& id) const;
    bool isRssiRefreshActive() const { return rssiTimer_.isActive(); }

signals:
    void connectionStateChanged(const QString& id, bdf::ConnectionState state);

private slots:
    void onPeripheralConnected(const QString& id, const QString& name);
    void onPeripheralConnectFailed(const QString& id, const QString& error);
    void onPeripheralDisconnected(const QString& id, const QString& error);
    void onServicesDiscovered(const QString& id, const QList<QBluetoothUuid>& services);
    void onServiceDiscoveryFailed(const QString& id, const QString& error);
    void onCharacteristicsDiscovered(const QString& id, const QBluetoothUuid& service,
                                     const QList<bdf::ble::CharacteristicInfo>& characteristics);
    void onCharacteristicValueUpdated(const QString& id, const QBluetoothUuid& service,
                                      const QBluetoothUuid& characteristic, const QByteArray& value);
    void onCharacteristicError(const QString& id, const QBluetoothUuid& characteristic,
                               const QString& error);
    void onRssiRead(const QString& id, int rssi);
    void onPowerStateChanged(bdf::ble::RadioPowerState state);
    void onDeviceRemoved(const QString& id);
    void onDeviceDiscovered(const bdf::Device& device);
    void refreshRssi();

private:
    struct ConnectionAttempt {
        QString deviceId;
        QDateTime startedAt;
        QDateTime timeoutAt;
        std::unique_ptr<QTimer> timer;
    };

    struct LinkState {
        int serviceDiscoveryAttempts = 0;
        QMap<QBluetoothUuid, QList<CharacteristicInfo>> characteristics;
        QList<QBluetoothUuid> pendingCharacteristicDiscoveries;
        QList<QBluetoothUuid> retriedReads;
        std::unique_ptr<QTimer> retryTimer;
    };

    ConnectionState stateOf(const QString& id) const;
    void setState(const QString& id, ConnectionState state);
    void failAttempt(const QString& id, Condition condition, const QString& message);
    void onConnectTimeout(const QString& id);
    bool abandonAttempt(const QString& id);
    void requestCancel(const QString& id);
    void beginServiceDiscovery(const QString& id);
    bool dropAttempt(const QString& id);
    bool dropLink(const QString& id);
    void updateRssiTimer();
    const CharacteristicInfo* findCharacteristic(const QString& id, const QBluetoothUuid& service,
                                                 const QBluetoothUuid& characteristic) const;

    RadioSession* radio_;
    DeviceRegistry* registry_;
    INotificationService* notifications_;

    int connectTimeoutMs_;
    int maxServiceDiscoveryAttempts_;
    int serviceDiscoveryRetryMs_;
    bool autoConnectSaved_;

    std::map<QString, ConnectionAttempt> attempts_;
    std::map<QString, LinkState> links_;
    // Radio answers still owed to requests nobody waits for any more.
    QHash<QString, int> staleConnects_;
    QHash<QString, int> pendingCancels_;
    QSet<QString> autoConnectTried_;
    QTimer rssiTimer_;
};

} // namespace ble
} // namespace bdf
