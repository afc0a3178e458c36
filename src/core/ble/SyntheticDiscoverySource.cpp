#include "core/ble/SyntheticDiscoverySource.hpp"
#include "core/ble/GattUuids.hpp"
#include "core/services/IConfigService.hpp"
#include <QRandomGenerator>
#include <QUuid>
#include <boost/log/trivial.hpp>

namespace bdf {
namespace ble {

const std::vector<SyntheticDiscoverySource::Profile>& SyntheticDiscoverySource::catalog()
{
    static const std::vector<Profile> profiles = {
        {QStringLiteral("AirPods Pro"),            DeviceCategory::Headphones, -55},
        {QStringLiteral("Apple Watch"),            DeviceCategory::Watch,      -62},
        {QStringLiteral("Bose SoundLink Speaker"), DeviceCategory::Speaker,    -70},
        {QStringLiteral("Magic Keyboard"),         DeviceCategory::Keyboard,   -58},
        {QStringLiteral("MX Master Mouse"),        DeviceCategory::Mouse,      -66},
        {QStringLiteral("Pixel Phone"),            DeviceCategory::Phone,      -74},
        {QStringLiteral("iPad Air"),               DeviceCategory::Tablet,     -81},
        {QStringLiteral("MacBook Pro"),            DeviceCategory::Laptop,     -77},
    };
    return profiles;
}

SyntheticDiscoverySource::SyntheticDiscoverySource(IConfigService* config, QObject* parent)
    : RadioSession(parent)
    , staggerMs_(configInt(config, "synthetic.stagger_ms", 1500))
    , updateIntervalMs_(configInt(config, "synthetic.update_interval_ms", 2000))
    , updateCycles_(configInt(config, "synthetic.update_cycles", 5))
    , jitterDb_(configInt(config, "synthetic.jitter_db", 4))
    , connectDelayMs_(configInt(config, "synthetic.connect_delay_ms", 800))
{
    for (const auto& profile : catalog()) {
        Catalogued entry;
        entry.id = QUuid::createUuid().toString(QUuid::WithoutBraces).toUpper();
        entry.profile = profile;
        ids_.append(entry.id);
        entries_.push_back(entry);
    }
}

SyntheticDiscoverySource::~SyntheticDiscoverySource() = default;

void SyntheticDiscoverySource::startDiscovery(const ScanFilter& filter)
{
    // Narrowing the filter mid-run leaves the schedule as is.
    if (discovering_) {
        BOOST_LOG_TRIVIAL(debug) << "[Synthetic] Filter change ignored ("
                                 << filter.serviceUuids.size() << " service(s))";
        return;
    }

    discovering_ = true;
    BOOST_LOG_TRIVIAL(info) << "[Synthetic] Simulating " << entries_.size() << " device(s)";

    for (int i = 0; i < static_cast<int>(entries_.size()); ++i) {
        entries_[i].cyclesLeft = updateCycles_;

        const QString key = entries_[i].id;
        auto timer = std::make_unique<QTimer>();
        timer->setSingleShot(true);
        connect(timer.get(), &QTimer::timeout, this, [this, i, key]() {
            advertise(i);

            // Stagger done; hand over to the jitter timer under the same key.
            auto repeat = std::make_unique<QTimer>();
            repeat->setInterval(updateIntervalMs_);
            connect(repeat.get(), &QTimer::timeout, this, [this, i, key]() {
                Catalogued& entry = entries_[i];
                if (entry.cyclesLeft <= 0) {
                    cancelTimer(key);
                    return;
                }
                --entry.cyclesLeft;
                advertise(i);
            });
            repeat->start();
            auto& slot = timers_[key];
            if (slot)
                slot.release()->deleteLater();
            slot = std::move(repeat);
        });
        timer->start(i * staggerMs_);
        timers_[key] = std::move(timer);
    }
}

void SyntheticDiscoverySource::stopDiscovery()
{
    if (!discovering_)
        return;
    discovering_ = false;
    for (auto& entry : timers_) {
        entry.second->stop();
        entry.second.release()->deleteLater();
    }
    timers_.clear();
    BOOST_LOG_TRIVIAL(info) << "[Synthetic] Discovery stopped";
}

void SyntheticDiscoverySource::advertise(int index)
{
    emit advertisementReceived(advertisementFor(entries_[index]));
}

Advertisement SyntheticDiscoverySource::advertisementFor(const Catalogued& entry) const
{
    Advertisement adv;
    adv.identity = entry.id;
    const int jitter = jitterDb_ > 0
        ? QRandomGenerator::global()->bounded(-jitterDb_, jitterDb_ + 1)
        : 0;
    adv.rssi = entry.profile.baseRssi + jitter;
    adv.data.localName = entry.profile.name;
    adv.data.serviceUuids = {gatt::batteryService(), gatt::immediateAlertService(),
                             gatt::deviceInformationService()};
    return adv;
}

void SyntheticDiscoverySource::cancelTimer(const QString& key)
{
    auto it = timers_.find(key);
    if (it == timers_.end())
        return;
    // Called from the timer's own slot; let the event loop finish with it first.
    it->second->stop();
    it->second.release()->deleteLater();
    timers_.erase(it);
}

int SyntheticDiscoverySource::findIndex(const QString& id) const
{
    for (int i = 0; i < static_cast<int>(entries_.size()); ++i) {
        if (entries_[i].id == id)
            return i;
    }
    return -1;
}

// --- Simulated connection path ---

void SyntheticDiscoverySource::connectPeripheral(const QString& id)
{
    const int index = findIndex(id);
    auto timer = std::make_unique<QTimer>();
    timer->setSingleShot(true);
    connect(timer.get(), &QTimer::timeout, this, [this, id, index]() {
        auto it = connectTimers_.find(id);
        if (it != connectTimers_.end()) {
            it->second.release()->deleteLater();
            connectTimers_.erase(it);
        }
        if (index < 0) {
            emit peripheralConnectFailed(id, QStringLiteral("Unknown device"));
            return;
        }
        connected_.insert(id);
        emit peripheralConnected(id, entries_[index].profile.name);
    });
    timer->start(connectDelayMs_);
    connectTimers_[id] = std::move(timer);
}

void SyntheticDiscoverySource::cancelPeripheralConnection(const QString& id)
{
    if (connectTimers_.erase(id) > 0)
        QTimer::singleShot(0, this, [this, id]() { emit peripheralConnectFailed(id, QStringLiteral("Cancelled")); });
    connected_.remove(id);
    QTimer::singleShot(0, this, [this, id]() { emit peripheralDisconnected(id, QString()); });
}

void SyntheticDiscoverySource::discoverServices(const QString& id)
{
    QTimer::singleShot(0, this, [this, id]() {
        if (!connected_.contains(id)) {
            emit serviceDiscoveryFailed(id, QStringLiteral("Not connected"));
            return;
        }
        emit servicesDiscovered(id, {gatt::batteryService(), gatt::immediateAlertService(),
                                     gatt::deviceInformationService()});
    });
}

void SyntheticDiscoverySource::discoverCharacteristics(const QString& id, const QBluetoothUuid& service)
{
    QList<CharacteristicInfo> result;
    if (service == gatt::batteryService()) {
        CharacteristicInfo level;
        level.uuid = gatt::batteryLevel();
        level.canRead = true;
        level.canNotify = true;
        result.append(level);
    } else if (service == gatt::immediateAlertService()) {
        CharacteristicInfo alert;
        alert.uuid = gatt::alertLevel();
        alert.canWriteWithoutResponse = true;
        result.append(alert);
    } else if (service == gatt::deviceInformationService()) {
        CharacteristicInfo manufacturer;
        manufacturer.uuid = gatt::manufacturerNameString();
        manufacturer.canRead = true;
        CharacteristicInfo model;
        model.uuid = gatt::modelNumberString();
        model.canRead = true;
        result << manufacturer << model;
    }
    QTimer::singleShot(0, this, [this, id, service, result]() {
        emit characteristicsDiscovered(id, service, result);
    });
}

void SyntheticDiscoverySource::readCharacteristic(const QString& id, const QBluetoothUuid& service,
                                                  const QBluetoothUuid& characteristic)
{
    QByteArray value;
    if (characteristic == gatt::batteryLevel()) {
        value.append(static_cast<char>(QRandomGenerator::global()->bounded(20, 101)));
    } else if (characteristic == gatt::manufacturerNameString()) {
        value = QByteArrayLiteral("Synthetic Devices Inc.");
    } else if (characteristic == gatt::modelNumberString()) {
        const int index = findIndex(id);
        value = index >= 0 ? entries_[index].profile.name.toUtf8() : QByteArray();
    }

    QTimer::singleShot(0, this, [this, id, service, characteristic, value]() {
        if (!connected_.contains(id)) {
            emit characteristicError(id, characteristic, QStringLiteral("Not connected"));
            return;
        }
        if (value.isEmpty()) {
            emit characteristicError(id, characteristic, QStringLiteral("Not readable"));
            return;
        }
        emit characteristicValueUpdated(id, service, characteristic, value);
    });
}

void SyntheticDiscoverySource::writeCharacteristic(const QString& id, const QBluetoothUuid& /*service*/,
                                                   const QBluetoothUuid& characteristic,
                                                   const QByteArray& value, bool /*withResponse*/)
{
    BOOST_LOG_TRIVIAL(info) << "[Synthetic] " << id.toStdString() << " <- "
                            << characteristic.toString().toStdString() << " "
                            << value.toHex().toStdString();
}

void SyntheticDiscoverySource::setNotify(const QString& id, const QBluetoothUuid& service,
                                         const QBluetoothUuid& characteristic, bool enabled)
{
    BOOST_LOG_TRIVIAL(debug) << "[Synthetic] Notify " << (enabled ? "on " : "off ")
                             << characteristic.toString().toStdString() << " for " << id.toStdString()
                             << " (" << service.toString().toStdString() << ")";
}

void SyntheticDiscoverySource::readRssi(const QString& id)
{
    const int index = findIndex(id);
    if (index < 0 || !connected_.contains(id))
        return;
    const Advertisement adv = advertisementFor(entries_[index]);
    QTimer::singleShot(0, this, [this, id, rssi = *adv.rssi]() { emit rssiRead(id, rssi); });
}

} // namespace ble
} // namespace bdf
