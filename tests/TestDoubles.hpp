#pragma once

#include <QList>
#include <QPair>
#include <cmath>
#include <QMap>
#include <QStringList>
#include "core/ble/RadioSession.hpp"
#include "core/services/IConfigService.hpp"
#include "core/services/IDevicePersistence.hpp"
#include "core/services/ILocationProvider.hpp"

class MockConfigService : public bdf::IConfigService {
public:
    QVariant value(const QString& path) const override {
        return values_.value(path);
    }
    void setValue(const QString& path, const QVariant& value) override {
        values_[path] = value;
    }
    void save() override {}

    QMap<QString, QVariant> values_;
};

class FakePersistence : public bdf::IDevicePersistence {
public:
    QList<bdf::Device> loadSavedDevices() override { return stored; }
    bool saveDevices(const QList<bdf::Device>& devices) override {
        ++saveCount;
        lastSaved = devices;
        if (failWrites)
            return false;
        stored = devices;
        return true;
    }

    QList<bdf::Device> stored;
    QList<bdf::Device> lastSaved;
    int saveCount = 0;
    bool failWrites = false;
};

class FakeLocationProvider : public bdf::ILocationProvider {
public:
    std::optional<bdf::Coordinate> currentPosition() const override { return position; }
    double distanceBetween(const bdf::Coordinate& a, const bdf::Coordinate& b) const override {
        return std::abs(a.latitude - b.latitude) * 1000.0 + std::abs(a.longitude - b.longitude) * 1000.0;
    }

    std::optional<bdf::Coordinate> position;
};

/// Records every request and lets the test drive the callbacks by emitting
/// the RadioSession signals directly.
class FakeRadioSession : public bdf::ble::RadioSession {
public:
    struct Write {
        QString id;
        QBluetoothUuid service;
        QBluetoothUuid characteristic;
        QByteArray value;
        bool withResponse;
    };

    bdf::ble::RadioPowerState powerState() const override { return state; }
    bool isSynthetic() const override { return synthetic; }

    void startDiscovery(const bdf::ble::ScanFilter& filter) override { discoveryStarts.append(filter); }
    void stopDiscovery() override { ++stopCount; }

    void connectPeripheral(const QString& id) override { connectRequests.append(id); }
    void cancelPeripheralConnection(const QString& id) override {
        cancelRequests.append(id);
        if (disconnectOnCancel)
            emit peripheralDisconnected(id, QString());
    }

    void discoverServices(const QString& id) override { serviceRequests.append(id); }
    void discoverCharacteristics(const QString& id, const QBluetoothUuid& service) override {
        characteristicRequests.append(qMakePair(id, service));
    }
    void readCharacteristic(const QString& id, const QBluetoothUuid&,
                            const QBluetoothUuid& characteristic) override {
        reads.append(qMakePair(id, characteristic));
    }
    void writeCharacteristic(const QString& id, const QBluetoothUuid& service,
                             const QBluetoothUuid& characteristic,
                             const QByteArray& value, bool withResponse) override {
        writes.append({id, service, characteristic, value, withResponse});
    }
    void setNotify(const QString& id, const QBluetoothUuid&,
                   const QBluetoothUuid& characteristic, bool enabled) override {
        if (enabled)
            notifies.append(qMakePair(id, characteristic));
    }
    void readRssi(const QString& id) override { rssiRequests.append(id); }

    void setState(bdf::ble::RadioPowerState s) {
        state = s;
        emit powerStateChanged(s);
    }

    bdf::ble::RadioPowerState state = bdf::ble::RadioPowerState::PoweredOn;
    bool synthetic = false;
    bool disconnectOnCancel = true;

    QList<bdf::ble::ScanFilter> discoveryStarts;
    int stopCount = 0;
    QStringList connectRequests;
    QStringList cancelRequests;
    QStringList serviceRequests;
    QList<QPair<QString, QBluetoothUuid>> characteristicRequests;
    QList<QPair<QString, QBluetoothUuid>> reads;
    QList<Write> writes;
    QList<QPair<QString, QBluetoothUuid>> notifies;
    QStringList rssiRequests;
};

inline bdf::Advertisement makeAdvertisement(const QString& id, const QString& name, std::optional<int> rssi)
{
    bdf::Advertisement adv;
    adv.identity = id;
    adv.rssi = rssi;
    adv.data.localName = name;
    return adv;
}
