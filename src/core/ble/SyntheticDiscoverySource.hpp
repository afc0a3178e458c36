#pragma once

#include "core/ble/RadioSession.hpp"
#include <QSet>
#include <QTimer>
#include <map>
#include <memory>
#include <vector>

namespace bdf {

class IConfigService;

namespace ble {

/// RadioSession with no radio behind it. Replays a fixed catalog of
/// plausible peripherals on timers and simulates the connection path so
/// the rest of the stack runs unchanged.
class SyntheticDiscoverySource : public RadioSession {
    Q_OBJECT
public:
    struct Profile {
        QString name;
        DeviceCategory category;
        int baseRssi;
    };

    static const std::vector<Profile>& catalog();

    explicit SyntheticDiscoverySource(IConfigService* config = nullptr, QObject* parent = nullptr);
    ~SyntheticDiscoverySource() override;

    RadioPowerState powerState() const override { return RadioPowerState::PoweredOn; }
    bool isSynthetic() const override { return true; }

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

    bool isDiscovering() const { return discovering_; }
    /// Number of live discovery timers (stagger + jitter).
    int activeTimerCount() const { return static_cast<int>(timers_.size()); }
    QStringList identities() const { return ids_; }

private:
    struct Catalogued {
        QString id;
        Profile profile;
        int cyclesLeft = 0;
    };

    Advertisement advertisementFor(const Catalogued& entry) const;
    void advertise(int index);
    void cancelTimer(const QString& key);
    int findIndex(const QString& id) const;

    int staggerMs_;
    int updateIntervalMs_;
    int updateCycles_;
    int jitterDb_;
    int connectDelayMs_;

    bool discovering_ = false;
    QStringList ids_;                       // generated once per instance
    std::vector<Catalogued> entries_;
    QSet<QString> connected_;
    std::map<QString, std::unique_ptr<QTimer>> timers_;         // discovery timers by key
    std::map<QString, std::unique_ptr<QTimer>> connectTimers_;  // pending connects by id
};

} // namespace ble
} // namespace bdf
