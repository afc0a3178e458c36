#include "core/ble/BluezRadioSession.hpp"
#include "core/services/IConfigService.hpp"
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDBusServiceWatcher>
#include <QDBusVariant>
#include <QDebug>

namespace bdf {
namespace ble {

namespace {
const QString kBluezService = QStringLiteral("org.bluez");
const QString kAdapterIface = QStringLiteral("org.bluez.Adapter1");
const QString kDeviceIface = QStringLiteral("org.bluez.Device1");
const QString kGattServiceIface = QStringLiteral("org.bluez.GattService1");
const QString kGattCharIface = QStringLiteral("org.bluez.GattCharacteristic1");
const QString kPropertiesIface = QStringLiteral("org.freedesktop.DBus.Properties");
const QString kObjectManagerIface = QStringLiteral("org.freedesktop.DBus.ObjectManager");

constexpr int kServicesResolveTimeoutMs = 10000;
}

BluezRadioSession::BluezRadioSession(IConfigService* config, QObject* parent)
    : RadioSession(parent)
    , config_(config)
{
}

BluezRadioSession::~BluezRadioSession()
{
    if (discovering_ && !adapterPath_.isEmpty()) {
        QDBusInterface adapter(kBluezService, adapterPath_, kAdapterIface, QDBusConnection::systemBus());
        adapter.asyncCall("StopDiscovery");
    }
}

void BluezRadioSession::initialize()
{
    auto bus = QDBusConnection::systemBus();
    if (!bus.isConnected()) {
        qWarning() << "[BluezRadio] System bus unavailable:" << bus.lastError().message();
        setPowerState(RadioPowerState::Unsupported);
        return;
    }

    const QString preferred = config_ ? config_->value("radio.adapter").toString() : QString();
    const ManagedObjects objects = managedObjects();

    adapterPath_.clear();
    QVariantMap adapterProps;
    for (auto it = objects.begin(); it != objects.end(); ++it) {
        if (!it->contains(kAdapterIface))
            continue;
        if (!preferred.isEmpty() && !it.key().endsWith(QLatin1Char('/') + preferred))
            continue;
        adapterPath_ = it.key();
        adapterProps = it->value(kAdapterIface);
        break;
    }

    if (adapterPath_.isEmpty()) {
        qWarning() << "[BluezRadio] No BlueZ adapter found" << (preferred.isEmpty() ? QString() : preferred);
        setPowerState(RadioPowerState::Unsupported);
        return;
    }
    qInfo() << "[BluezRadio] Using adapter" << adapterPath_;

    // Seed the cache with devices BlueZ already knows about.
    for (auto it = objects.begin(); it != objects.end(); ++it) {
        if (it->contains(kDeviceIface) && it.key().startsWith(adapterPath_))
            updateDevice(it.key(), it->value(kDeviceIface), false);
    }

    if (!serviceWatcher_) {
        bus.connect(kBluezService, QString(), kPropertiesIface, "PropertiesChanged",
                    this, SLOT(onPropertiesChanged(QString,QVariantMap,QStringList,QDBusMessage)));
        bus.connect(kBluezService, "/", kObjectManagerIface, "InterfacesAdded",
                    this, SLOT(onInterfacesAdded(QDBusMessage)));
        bus.connect(kBluezService, "/", kObjectManagerIface, "InterfacesRemoved",
                    this, SLOT(onInterfacesRemoved(QDBusMessage)));

        serviceWatcher_ = new QDBusServiceWatcher(kBluezService, bus,
            QDBusServiceWatcher::WatchForRegistration | QDBusServiceWatcher::WatchForUnregistration, this);
        connect(serviceWatcher_, &QDBusServiceWatcher::serviceUnregistered, this, [this]() {
            qWarning() << "[BluezRadio] BlueZ left the bus";
            discovering_ = false;
            setPowerState(RadioPowerState::Resetting);
        });
        connect(serviceWatcher_, &QDBusServiceWatcher::serviceRegistered, this, [this]() {
            qInfo() << "[BluezRadio] BlueZ restarted, re-initializing";
            initialize();
        });
    }

    setPowerState(powerStateFromAdapter(adapterProps));
}

// --- Discovery ---

void BluezRadioSession::startDiscovery(const ScanFilter& filter)
{
    if (adapterPath_.isEmpty()) {
        qWarning() << "[BluezRadio] startDiscovery without adapter";
        return;
    }
    filter_ = filter;

    QDBusInterface adapter(kBluezService, adapterPath_, kAdapterIface, QDBusConnection::systemBus());
    QDBusPendingCall filterCall = adapter.asyncCall("SetDiscoveryFilter", discoveryFilterFor(filter));
    auto* filterWatcher = new QDBusPendingCallWatcher(filterCall, this);
    connect(filterWatcher, &QDBusPendingCallWatcher::finished, this, [this, filterWatcher]() {
        filterWatcher->deleteLater();
        if (filterWatcher->isError())
            handleDbusError("SetDiscoveryFilter", filterWatcher->error().name(),
                            filterWatcher->error().message());
    });

    qInfo() << "[BluezRadio] Discovery filter:"
            << (filter.mode == ScanMode::Broad ? "broad" : "narrow")
            << filter.serviceUuids.size() << "service(s)";

    if (discovering_)
        return;

    discovering_ = true;
    QDBusPendingCall pending = adapter.asyncCall("StartDiscovery");
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            // InProgress means another client already runs discovery; we still get the signals.
            if (watcher->error().name() == QLatin1String("org.bluez.Error.InProgress"))
                return;
            discovering_ = false;
            handleDbusError("StartDiscovery", watcher->error().name(), watcher->error().message());
            return;
        }
        qInfo() << "[BluezRadio] Discovery started";
    });
}

void BluezRadioSession::stopDiscovery()
{
    if (!discovering_ || adapterPath_.isEmpty())
        return;
    discovering_ = false;

    QDBusInterface adapter(kBluezService, adapterPath_, kAdapterIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = adapter.asyncCall("StopDiscovery");
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher]() {
        watcher->deleteLater();
        if (watcher->isError())
            handleDbusError("StopDiscovery", watcher->error().name(), watcher->error().message());
        else
            qInfo() << "[BluezRadio] Discovery stopped";
    });
}

// --- Connection ---

void BluezRadioSession::connectPeripheral(const QString& id)
{
    const QString path = pathFor(id);
    if (path.isEmpty()) {
        emitDeferred([this, id]() { emit peripheralConnectFailed(id, QStringLiteral("Unknown device")); });
        return;
    }

    pendingConnects_.insert(id);
    qInfo() << "[BluezRadio] Connecting" << id;

    QDBusInterface device(kBluezService, path, kDeviceIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = device.asyncCall("Connect");
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id]() {
        watcher->deleteLater();
        pendingConnects_.remove(id);

        if (watcher->isError()) {
            qInfo() << "[BluezRadio] Connect failed:" << watcher->error().message();
            emit peripheralConnectFailed(id, watcher->error().message());
            return;
        }
        connected_.insert(id);
        emit peripheralConnected(id, nameFor(id));
    });
}

void BluezRadioSession::cancelPeripheralConnection(const QString& id)
{
    resolveTimers_.erase(id);
    gatt_.remove(id);

    // A pending Connect still answers through its own reply.
    const QString path = pathFor(id);
    if (path.isEmpty()) {
        connected_.remove(id);
        emitDeferred([this, id]() { emit peripheralDisconnected(id, QStringLiteral("Unknown device")); });
        return;
    }

    QDBusInterface device(kBluezService, path, kDeviceIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = device.asyncCall("Disconnect");
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id]() {
        watcher->deleteLater();
        connected_.remove(id);
        QString error;
        if (watcher->isError()) {
            error = watcher->error().message();
            qInfo() << "[BluezRadio] Disconnect reported:" << error;
        }
        emit peripheralDisconnected(id, error);
    });
}

// --- GATT ---

void BluezRadioSession::discoverServices(const QString& id)
{
    const QString path = pathFor(id);
    if (path.isEmpty()) {
        emitDeferred([this, id]() { emit serviceDiscoveryFailed(id, QStringLiteral("Unknown device")); });
        return;
    }

    if (devices_.value(path).servicesResolved) {
        emitDeferred([this, id]() { onServicesResolved(id); });
        return;
    }

    // Wait for ServicesResolved; the timer owns the deadline.
    auto timer = std::make_unique<QTimer>();
    timer->setSingleShot(true);
    connect(timer.get(), &QTimer::timeout, this, [this, id]() {
        resolveTimers_.erase(id);
        qWarning() << "[BluezRadio] Services not resolved for" << id;
        emit serviceDiscoveryFailed(id, QStringLiteral("Services not resolved"));
    });
    timer->start(kServicesResolveTimeoutMs);
    resolveTimers_[id] = std::move(timer);
}

void BluezRadioSession::onServicesResolved(const QString& id)
{
    resolveTimers_.erase(id);
    enumerateGatt(id);

    const GattTable& table = gatt_[id];
    if (table.servicePaths.isEmpty()) {
        emit serviceDiscoveryFailed(id, QStringLiteral("No GATT services exported"));
        return;
    }
    emit servicesDiscovered(id, table.servicePaths.keys());
}

void BluezRadioSession::enumerateGatt(const QString& id)
{
    const QString devicePath = pathFor(id);
    const ManagedObjects objects = managedObjects();

    GattTable table;
    QHash<QString, QBluetoothUuid> serviceByPath;
    for (auto it = objects.begin(); it != objects.end(); ++it) {
        if (!it->contains(kGattServiceIface))
            continue;
        const QVariantMap props = it->value(kGattServiceIface);
        if (props.value("Device").value<QDBusObjectPath>().path() != devicePath)
            continue;
        const QBluetoothUuid uuid(props.value("UUID").toString());
        table.servicePaths.insert(uuid, it.key());
        serviceByPath.insert(it.key(), uuid);
    }

    for (auto it = objects.begin(); it != objects.end(); ++it) {
        if (!it->contains(kGattCharIface))
            continue;
        const QVariantMap props = it->value(kGattCharIface);
        const QString servicePath = props.value("Service").value<QDBusObjectPath>().path();
        if (!serviceByPath.contains(servicePath))
            continue;
        GattCharacteristic ch;
        ch.path = it.key();
        ch.service = serviceByPath.value(servicePath);
        ch.info = characteristicFromFlags(QBluetoothUuid(props.value("UUID").toString()),
                                          props.value("Flags").toStringList());
        table.characteristics.append(ch);
    }

    qInfo() << "[BluezRadio]" << id << "exports" << table.servicePaths.size() << "service(s),"
            << table.characteristics.size() << "characteristic(s)";
    gatt_.insert(id, table);
}

void BluezRadioSession::discoverCharacteristics(const QString& id, const QBluetoothUuid& service)
{
    QList<CharacteristicInfo> result;
    for (const auto& ch : gatt_.value(id).characteristics) {
        if (ch.service == service)
            result.append(ch.info);
    }
    emitDeferred([this, id, service, result]() { emit characteristicsDiscovered(id, service, result); });
}

void BluezRadioSession::readCharacteristic(const QString& id, const QBluetoothUuid& service,
                                           const QBluetoothUuid& characteristic)
{
    const GattCharacteristic* ch = findCharacteristic(id, service, characteristic);
    if (!ch) {
        emitDeferred([this, id, characteristic]() {
            emit characteristicError(id, characteristic, QStringLiteral("Characteristic not found"));
        });
        return;
    }

    QDBusInterface iface(kBluezService, ch->path, kGattCharIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = iface.asyncCall("ReadValue", QVariantMap());
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, watcher, id, service, characteristic]() {
        watcher->deleteLater();
        QDBusPendingReply<QByteArray> reply = *watcher;
        if (reply.isError()) {
            emit characteristicError(id, characteristic, reply.error().message());
            return;
        }
        emit characteristicValueUpdated(id, service, characteristic, reply.value());
    });
}

void BluezRadioSession::writeCharacteristic(const QString& id, const QBluetoothUuid& service,
                                            const QBluetoothUuid& characteristic,
                                            const QByteArray& value, bool withResponse)
{
    const GattCharacteristic* ch = findCharacteristic(id, service, characteristic);
    if (!ch) {
        emitDeferred([this, id, characteristic]() {
            emit characteristicError(id, characteristic, QStringLiteral("Characteristic not found"));
        });
        return;
    }

    QVariantMap options;
    options["type"] = withResponse ? QStringLiteral("request") : QStringLiteral("command");

    QDBusInterface iface(kBluezService, ch->path, kGattCharIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = iface.asyncCall("WriteValue", value, options);
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id, characteristic]() {
        watcher->deleteLater();
        if (watcher->isError())
            emit characteristicError(id, characteristic, watcher->error().message());
    });
}

void BluezRadioSession::setNotify(const QString& id, const QBluetoothUuid& service,
                                  const QBluetoothUuid& characteristic, bool enabled)
{
    const GattCharacteristic* ch = findCharacteristic(id, service, characteristic);
    if (!ch)
        return;

    QDBusInterface iface(kBluezService, ch->path, kGattCharIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = iface.asyncCall(enabled ? "StartNotify" : "StopNotify");
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id, characteristic]() {
        watcher->deleteLater();
        if (watcher->isError())
            emit characteristicError(id, characteristic, watcher->error().message());
    });
}

void BluezRadioSession::readRssi(const QString& id)
{
    const QString path = pathFor(id);
    if (path.isEmpty())
        return;

    QDBusInterface props(kBluezService, path, kPropertiesIface, QDBusConnection::systemBus());
    QDBusPendingCall pending = props.asyncCall("Get", kDeviceIface, QStringLiteral("RSSI"));
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher, id]() {
        watcher->deleteLater();
        QDBusPendingReply<QDBusVariant> reply = *watcher;
        // BlueZ drops RSSI from the property set once inquiry ends; not an error worth surfacing.
        if (reply.isError())
            return;
        bool ok = false;
        const int rssi = reply.value().variant().toInt(&ok);
        if (ok)
            emit rssiRead(id, rssi);
    });
}

// --- BlueZ signals ---

void BluezRadioSession::onPropertiesChanged(const QString& interface, const QVariantMap& changed,
                                            const QStringList& /*invalidated*/, const QDBusMessage& msg)
{
    const QString path = msg.path();

    if (interface == kAdapterIface && path == adapterPath_) {
        if (changed.contains("Powered") || changed.contains("PowerState")) {
            QVariantMap props = changed;
            if (!props.contains("Powered"))
                props.insert("Powered", powerState_ == RadioPowerState::PoweredOn);
            setPowerState(powerStateFromAdapter(props));
        }
        if (changed.contains("Discovering") && !changed.value("Discovering").toBool() && discovering_)
            qInfo() << "[BluezRadio] Adapter stopped discovering";
        return;
    }

    if (interface == kDeviceIface) {
        if (!path.startsWith(adapterPath_))
            return;
        const bool wasConnected = devices_.value(path).connected;
        const bool wasResolved = devices_.value(path).servicesResolved;
        updateDevice(path, changed, true);

        const DeviceEntry& entry = devices_[path];
        const QString id = entry.advertisement.identity;

        if (changed.contains("Connected") && entry.connected != wasConnected) {
            if (entry.connected && !pendingConnects_.contains(id) && !connected_.contains(id)) {
                qInfo() << "[BluezRadio] Unsolicited connection from" << id;
                connected_.insert(id);
                emit peripheralConnected(id, entry.name);
            } else if (!entry.connected && connected_.contains(id)) {
                connected_.remove(id);
                resolveTimers_.erase(id);
                gatt_.remove(id);
                emit peripheralDisconnected(id, QStringLiteral("Link lost"));
            }
        }

        if (entry.servicesResolved && !wasResolved && resolveTimers_.count(id) > 0)
            onServicesResolved(id);
        return;
    }

    if (interface == kGattCharIface && changed.contains("Value")) {
        for (auto it = gatt_.begin(); it != gatt_.end(); ++it) {
            for (const auto& ch : it->characteristics) {
                if (ch.path == path) {
                    emit characteristicValueUpdated(it.key(), ch.service, ch.info.uuid,
                                                    changed.value("Value").toByteArray());
                    return;
                }
            }
        }
    }
}

void BluezRadioSession::onInterfacesAdded(const QDBusMessage& msg)
{
    const QList<QVariant> args = msg.arguments();
    if (args.size() < 2)
        return;

    const QString path = args.at(0).value<QDBusObjectPath>().path();
    const InterfaceMap interfaces = readInterfaces(args.at(1).value<QDBusArgument>());

    if (interfaces.contains(kDeviceIface) && path.startsWith(adapterPath_))
        updateDevice(path, interfaces.value(kDeviceIface), true);
}

void BluezRadioSession::onInterfacesRemoved(const QDBusMessage& msg)
{
    const QList<QVariant> args = msg.arguments();
    if (args.size() < 2)
        return;

    const QString path = args.at(0).value<QDBusObjectPath>().path();
    const QStringList interfaces = args.at(1).toStringList();
    if (!interfaces.contains(kDeviceIface))
        return;

    auto it = devices_.find(path);
    if (it == devices_.end())
        return;
    // Only forget the path mapping; the device record itself lives in the registry.
    pathByAddress_.remove(it->advertisement.identity);
    devices_.erase(it);
}

// --- Internals ---

void BluezRadioSession::updateDevice(const QString& path, const QVariantMap& props, bool announce)
{
    DeviceEntry& entry = devices_[path];
    if (entry.advertisement.identity.isEmpty()) {
        entry.advertisement.identity = addressFromPath(path);
        entry.advertisement.handle = path;
    }
    mergeDeviceProperties(entry, props);
    pathByAddress_.insert(entry.advertisement.identity, path);

    if (!announce || !discovering_)
        return;

    // Only advertisement-bearing updates count as discovery events.
    const bool advertised = props.contains("RSSI") || props.contains("ManufacturerData")
                         || props.contains("ServiceData") || props.contains("UUIDs")
                         || props.contains("Name") || props.contains("TxPower");
    if (!advertised)
        return;

    if (filter_.mode == ScanMode::Narrow && !filter_.serviceUuids.isEmpty()) {
        bool matches = false;
        for (const auto& uuid : entry.advertisement.data.serviceUuids) {
            if (filter_.serviceUuids.contains(uuid)) {
                matches = true;
                break;
            }
        }
        if (!matches)
            return;
    }

    Advertisement adv = entry.advertisement;
    if (!props.contains("RSSI"))
        adv.rssi = std::nullopt;
    emit advertisementReceived(adv);
}

void BluezRadioSession::mergeDeviceProperties(DeviceEntry& entry, const QVariantMap& props)
{
    Advertisement& adv = entry.advertisement;
    if (props.contains("Address"))
        adv.identity = props.value("Address").toString();
    if (props.contains("Name")) {
        entry.name = props.value("Name").toString();
        adv.data.localName = entry.name;
    }
    if (props.contains("RSSI"))
        adv.rssi = props.value("RSSI").toInt();
    if (props.contains("TxPower"))
        adv.data.txPower = props.value("TxPower").toInt();
    if (props.contains("UUIDs"))
        adv.data.serviceUuids = parseUuids(props.value("UUIDs").toStringList());
    if (props.contains("ManufacturerData"))
        adv.data.manufacturerData = parseManufacturerData(props.value("ManufacturerData"));
    if (props.contains("ServiceData"))
        adv.data.serviceData = parseServiceData(props.value("ServiceData"));
    if (props.contains("Connected"))
        entry.connected = props.value("Connected").toBool();
    if (props.contains("ServicesResolved"))
        entry.servicesResolved = props.value("ServicesResolved").toBool();
}

Advertisement BluezRadioSession::advertisementFromProperties(const QString& path, const QVariantMap& props)
{
    DeviceEntry entry;
    entry.advertisement.identity = addressFromPath(path);
    entry.advertisement.handle = path;
    mergeDeviceProperties(entry, props);
    return entry.advertisement;
}

QMap<quint16, QByteArray> BluezRadioSession::parseManufacturerData(const QVariant& value)
{
    QMap<quint16, QByteArray> result;
    if (value.userType() != qMetaTypeId<QDBusArgument>())
        return result;

    // a{qv}: company id -> byte array
    const QDBusArgument arg = value.value<QDBusArgument>();
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        quint16 company = 0;
        QDBusVariant payload;
        arg >> company >> payload;
        arg.endMapEntry();
        result.insert(company, payload.variant().toByteArray());
    }
    arg.endMap();
    return result;
}

QMap<QBluetoothUuid, QByteArray> BluezRadioSession::parseServiceData(const QVariant& value)
{
    QMap<QBluetoothUuid, QByteArray> result;
    if (value.userType() != qMetaTypeId<QDBusArgument>())
        return result;

    // a{sv}: service uuid -> byte array
    const QDBusArgument arg = value.value<QDBusArgument>();
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QString uuid;
        QDBusVariant payload;
        arg >> uuid >> payload;
        arg.endMapEntry();
        result.insert(QBluetoothUuid(uuid), payload.variant().toByteArray());
    }
    arg.endMap();
    return result;
}

QList<QBluetoothUuid> BluezRadioSession::parseUuids(const QStringList& uuids)
{
    QList<QBluetoothUuid> result;
    for (const auto& s : uuids) {
        QBluetoothUuid uuid(s);
        if (!uuid.isNull())
            result.append(uuid);
    }
    return result;
}

CharacteristicInfo BluezRadioSession::characteristicFromFlags(const QBluetoothUuid& uuid,
                                                              const QStringList& flags)
{
    CharacteristicInfo info;
    info.uuid = uuid;
    info.canRead = flags.contains("read");
    info.canWrite = flags.contains("write");
    info.canWriteWithoutResponse = flags.contains("write-without-response");
    info.canNotify = flags.contains("notify") || flags.contains("indicate");
    return info;
}

RadioPowerState BluezRadioSession::powerStateFromAdapter(const QVariantMap& adapterProps)
{
    // PowerState (BlueZ >= 5.66): on, off, off-enabling, on-disabling, off-blocked
    const QString state = adapterProps.value("PowerState").toString();
    if (state == QLatin1String("off-blocked"))
        return RadioPowerState::Unauthorized;
    if (state == QLatin1String("off-enabling") || state == QLatin1String("on-disabling"))
        return RadioPowerState::Resetting;
    if (state == QLatin1String("on"))
        return RadioPowerState::PoweredOn;
    if (state == QLatin1String("off"))
        return RadioPowerState::PoweredOff;

    if (!adapterProps.contains("Powered"))
        return RadioPowerState::Unknown;
    return adapterProps.value("Powered").toBool() ? RadioPowerState::PoweredOn
                                                  : RadioPowerState::PoweredOff;
}

std::optional<RadioPowerState> BluezRadioSession::powerStateForError(const QString& dbusErrorName)
{
    if (dbusErrorName == QLatin1String("org.bluez.Error.NotAuthorized")
        || dbusErrorName == QLatin1String("org.freedesktop.DBus.Error.AccessDenied"))
        return RadioPowerState::Unauthorized;
    if (dbusErrorName == QLatin1String("org.bluez.Error.NotReady"))
        return RadioPowerState::PoweredOff;
    if (dbusErrorName == QLatin1String("org.freedesktop.DBus.Error.ServiceUnknown"))
        return RadioPowerState::Unsupported;
    return std::nullopt;
}

QVariantMap BluezRadioSession::discoveryFilterFor(const ScanFilter& filter)
{
    QVariantMap result;
    result["Transport"] = QStringLiteral("le");
    if (filter.mode == ScanMode::Broad) {
        result["DuplicateData"] = true;
        return result;
    }

    QStringList uuids;
    for (const auto& uuid : filter.serviceUuids)
        uuids.append(uuid.toString(QUuid::WithoutBraces));
    result["UUIDs"] = uuids;
    result["DuplicateData"] = false;
    return result;
}

QString BluezRadioSession::addressFromPath(const QString& devicePath)
{
    // e.g. /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF
    QString mac = devicePath.section('/', -1);
    if (!mac.startsWith(QLatin1String("dev_")))
        return {};
    mac = mac.mid(4);
    mac.replace('_', ':');
    return mac;
}

BluezRadioSession::InterfaceMap BluezRadioSession::readInterfaces(const QDBusArgument& arg)
{
    // a{sa{sv}}
    InterfaceMap result;
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QString ifaceName;
        arg >> ifaceName;

        QVariantMap props;
        arg.beginMap();
        while (!arg.atEnd()) {
            arg.beginMapEntry();
            QString key;
            QDBusVariant val;
            arg >> key >> val;
            props.insert(key, val.variant());
            arg.endMapEntry();
        }
        arg.endMap();

        result.insert(ifaceName, props);
        arg.endMapEntry();
    }
    arg.endMap();
    return result;
}

BluezRadioSession::ManagedObjects BluezRadioSession::managedObjects() const
{
    QDBusInterface objectManager(kBluezService, "/", kObjectManagerIface, QDBusConnection::systemBus());

    ManagedObjects result;
    QDBusMessage reply = objectManager.call("GetManagedObjects");
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        qWarning() << "[BluezRadio] GetManagedObjects failed:" << reply.errorMessage();
        return result;
    }

    // a{oa{sa{sv}}}
    const QDBusArgument arg = reply.arguments().first().value<QDBusArgument>();
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QDBusObjectPath objPath;
        arg >> objPath;
        result.insert(objPath.path(), readInterfaces(arg));
        arg.endMapEntry();
    }
    arg.endMap();
    return result;
}

void BluezRadioSession::setPowerState(RadioPowerState state)
{
    if (state == powerState_)
        return;
    qInfo() << "[BluezRadio] Power state" << toString(powerState_) << "->" << toString(state);
    powerState_ = state;
    if (state != RadioPowerState::PoweredOn)
        discovering_ = false;
    emit powerStateChanged(state);
}

void BluezRadioSession::handleDbusError(const QString& context, const QString& errorName,
                                        const QString& message)
{
    qWarning() << "[BluezRadio]" << context << "failed:" << errorName << message;
    if (auto state = powerStateForError(errorName))
        setPowerState(*state);
}

const BluezRadioSession::GattCharacteristic* BluezRadioSession::findCharacteristic(
    const QString& id, const QBluetoothUuid& service, const QBluetoothUuid& characteristic) const
{
    auto it = gatt_.constFind(id);
    if (it == gatt_.constEnd())
        return nullptr;
    for (const auto& ch : it->characteristics) {
        if (ch.service == service && ch.info.uuid == characteristic)
            return &ch;
    }
    return nullptr;
}

QString BluezRadioSession::pathFor(const QString& id) const
{
    return pathByAddress_.value(id);
}

QString BluezRadioSession::nameFor(const QString& id) const
{
    return devices_.value(pathFor(id)).name;
}

void BluezRadioSession::emitDeferred(std::function<void()> fn)
{
    QTimer::singleShot(0, this, std::move(fn));
}

} // namespace ble
} // namespace bdf
