#include "core/ble/ConnectionManager.hpp"
#include "core/ble/GattUuids.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/services/IConfigService.hpp"
#include <optional>
#include <boost/log/trivial.hpp>

namespace bdf {
namespace ble {

namespace {

bool isLinked(ConnectionState state)
{
    return state == ConnectionState::Connected
        || state == ConnectionState::ServiceDiscovery
        || state == ConnectionState::Ready;
}

// Alert Level values (Immediate Alert service)
constexpr char kMildAlert = 0x01;
constexpr char kHighAlert = 0x02;

// New Alert category: Simple Alert
constexpr char kSimpleAlertCategory = 0x00;

std::string str(const QString& s)
{
    return s.toStdString();
}

bool takeOwed(QHash<QString, int>& owed, const QString& id)
{
    auto it = owed.find(id);
    if (it == owed.end())
        return false;
    if (--it.value() <= 0)
        owed.erase(it);
    return true;
}

std::optional<QBluetoothUuid> readableService(const QMap<QBluetoothUuid, QList<CharacteristicInfo>>& table,
                                              const QBluetoothUuid& characteristic)
{
    for (auto it = table.constBegin(); it != table.constEnd(); ++it) {
        for (const auto& ch : it.value()) {
            if (ch.uuid == characteristic && ch.canRead)
                return it.key();
        }
    }
    return std::nullopt;
}

} // namespace

ConnectionManager::ConnectionManager(RadioSession* radio, DeviceRegistry* registry,
                                     INotificationService* notifications, IConfigService* config,
                                     QObject* parent)
    : QObject(parent)
    , radio_(radio)
    , registry_(registry)
    , notifications_(notifications)
    , connectTimeoutMs_(configInt(config, "connection.timeout_ms", 12000))
    , maxServiceDiscoveryAttempts_(configInt(config, "connection.max_service_discovery_attempts", 3))
    , serviceDiscoveryRetryMs_(configInt(config, "connection.service_discovery_retry_ms", 1000))
    , autoConnectSaved_(configBool(config, "connection.auto_connect_saved", false))
{
    rssiTimer_.setInterval(configInt(config, "connection.rssi_refresh_ms", 2000));
    connect(&rssiTimer_, &QTimer::timeout, this, &ConnectionManager::refreshRssi);

    connect(radio_, &RadioSession::peripheralConnected, this, &ConnectionManager::onPeripheralConnected);
    connect(radio_, &RadioSession::peripheralConnectFailed, this, &ConnectionManager::onPeripheralConnectFailed);
    connect(radio_, &RadioSession::peripheralDisconnected, this, &ConnectionManager::onPeripheralDisconnected);
    connect(radio_, &RadioSession::servicesDiscovered, this, &ConnectionManager::onServicesDiscovered);
    connect(radio_, &RadioSession::serviceDiscoveryFailed, this, &ConnectionManager::onServiceDiscoveryFailed);
    connect(radio_, &RadioSession::characteristicsDiscovered, this, &ConnectionManager::onCharacteristicsDiscovered);
    connect(radio_, &RadioSession::characteristicValueUpdated, this, &ConnectionManager::onCharacteristicValueUpdated);
    connect(radio_, &RadioSession::characteristicError, this, &ConnectionManager::onCharacteristicError);
    connect(radio_, &RadioSession::rssiRead, this, &ConnectionManager::onRssiRead);
    connect(radio_, &RadioSession::powerStateChanged, this, &ConnectionManager::onPowerStateChanged);

    connect(registry_, &DeviceRegistry::deviceRemoved, this, &ConnectionManager::onDeviceRemoved);
    connect(registry_, &DeviceRegistry::deviceDiscovered, this, &ConnectionManager::onDeviceDiscovered);
}

ConnectionManager::~ConnectionManager() = default;

// --- Requests ---

void ConnectionManager::connectDevice(const QString& id)
{
    const auto device = registry_->device(id);
    if (!device) {
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] connect: unknown device " << str(id);
        return;
    }

    const ConnectionState state = device->connectionState;
    if (state == ConnectionState::Connecting || isLinked(state) || state == ConnectionState::Disconnecting) {
        BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] connect ignored, " << str(id) << " is "
                                 << str(toString(state));
        return;
    }

    if (!radio_->isSynthetic() && radio_->powerState() != RadioPowerState::PoweredOn) {
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Cannot connect " << str(id) << ", radio is "
                                   << str(toString(radio_->powerState()));
        if (notifications_)
            notifications_->post(Condition::RadioUnavailable, id,
                                 QStringLiteral("Bluetooth is %1").arg(toString(radio_->powerState())));
        return;
    }

    ConnectionAttempt attempt;
    attempt.deviceId = id;
    attempt.startedAt = QDateTime::currentDateTime();
    attempt.timeoutAt = attempt.startedAt.addMSecs(connectTimeoutMs_);
    attempt.timer = std::make_unique<QTimer>();
    attempt.timer->setSingleShot(true);
    connect(attempt.timer.get(), &QTimer::timeout, this, [this, id]() { onConnectTimeout(id); });
    attempt.timer->start(connectTimeoutMs_);
    attempts_[id] = std::move(attempt);

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Connecting " << str(id) << " '"
                            << str(device->name) << "' (timeout " << connectTimeoutMs_ << " ms)";
    setState(id, ConnectionState::Connecting);
    radio_->connectPeripheral(id);
}

void ConnectionManager::disconnectDevice(const QString& id)
{
    const ConnectionState state = stateOf(id);
    if (state == ConnectionState::Disconnected || state == ConnectionState::Disconnecting
        || state == ConnectionState::Failed)
        return;

    abandonAttempt(id);
    dropLink(id);
    updateRssiTimer();

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Disconnecting " << str(id);
    setState(id, ConnectionState::Disconnecting);
    requestCancel(id);
}

bool ConnectionManager::readBatteryLevel(const QString& id)
{
    if (!isLinked(stateOf(id))) {
        if (notifications_)
            notifications_->post(Condition::NotConnected, id, QStringLiteral("Device is not connected"));
        return false;
    }

    const CharacteristicInfo* level = findCharacteristic(id, gatt::batteryService(), gatt::batteryLevel());
    if (!level || !level->canRead) {
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(id) << " exposes no readable battery level";
        return false;
    }
    radio_->readCharacteristic(id, gatt::batteryService(), gatt::batteryLevel());
    return true;
}

bool ConnectionManager::sendSignal(const QString& id, SignalKind kind)
{
    if (!isLinked(stateOf(id))) {
        if (notifications_)
            notifications_->post(Condition::NotConnected, id, QStringLiteral("Device is not connected"));
        return false;
    }

    if (const auto* alert = findCharacteristic(id, gatt::immediateAlertService(), gatt::alertLevel())) {
        const QByteArray value(1, kind == SignalKind::Sound ? kHighAlert : kMildAlert);
        radio_->writeCharacteristic(id, gatt::immediateAlertService(), gatt::alertLevel(), value,
                                    !alert->canWriteWithoutResponse);
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Alert level " << int(value.at(0))
                                << " sent to " << str(id);
        return true;
    }

    if (const auto* newAlert = findCharacteristic(id, gatt::alertNotificationService(), gatt::newAlert())) {
        // Category, count, then UTF-8 text.
        QByteArray value;
        value.append(kSimpleAlertCategory);
        value.append(char(1));
        value.append(kind == SignalKind::Sound ? QByteArrayLiteral("Find: sound")
                                               : QByteArrayLiteral("Find: vibrate"));
        radio_->writeCharacteristic(id, gatt::alertNotificationService(), gatt::newAlert(), value,
                                    !newAlert->canWriteWithoutResponse);
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] New alert sent to " << str(id);
        return true;
    }

    if (notifications_)
        notifications_->post(Condition::SignalUnsupported, id,
                             QStringLiteral("Device cannot play a sound or vibrate"));
    return false;
}

bool ConnectionManager::hasPendingAttempt(const QString& id) const
{
    auto it = attempts_.find(id);
    return it != attempts_.end() && it->second.timer && it->second.timer->isActive();
}

int ConnectionManager::serviceDiscoveryAttempts(const QString& id) const
{
    auto it = links_.find(id);
    return it == links_.end() ? 0 : it->second.serviceDiscoveryAttempts;
}

// --- Connection callbacks ---

void ConnectionManager::onConnectTimeout(const QString& id)
{
    if (!abandonAttempt(id))
        return;

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Connection to " << str(id) << " timed out after "
                               << connectTimeoutMs_ << " ms";
    failAttempt(id, Condition::ConnectionTimeout, QStringLiteral("Connection timed out"));
    requestCancel(id);
}

void ConnectionManager::onPeripheralConnected(const QString& id, const QString& name)
{
    if (takeOwed(staleConnects_, id)) {
        if (attempts_.count(id) > 0) {
            // The current request is still answered on its own.
            BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Late connection from " << str(id)
                                     << " while a newer attempt is pending";
            return;
        }
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Ignoring late connection from " << str(id);
        requestCancel(id);
        return;
    }

    if (dropAttempt(id)) {
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Connected " << str(id);
    } else {
        if (!registry_->contains(id))
            registry_->ensureDevice(id, name);
        const ConnectionState state = stateOf(id);
        if (isLinked(state) || state == ConnectionState::Disconnecting)
            return;
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Unsolicited connection from " << str(id);
    }

    dropLink(id);
    links_[id] = LinkState();
    setState(id, ConnectionState::Connected);
    updateRssiTimer();
    beginServiceDiscovery(id);
}

void ConnectionManager::onPeripheralConnectFailed(const QString& id, const QString& error)
{
    if (takeOwed(staleConnects_, id)) {
        BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Connect failure for " << str(id)
                                 << " answers an abandoned attempt";
        return;
    }
    if (!dropAttempt(id)) {
        BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Stale connect failure for " << str(id);
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Connection to " << str(id) << " failed: " << str(error);
    failAttempt(id, Condition::ConnectionFailed,
                error.isEmpty() ? QStringLiteral("Connection failed") : error);
}

void ConnectionManager::onPeripheralDisconnected(const QString& id, const QString& error)
{
    const bool answersCancel = takeOwed(pendingCancels_, id);
    if (attempts_.count(id) > 0) {
        if (answersCancel) {
            BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Disconnect for " << str(id)
                                     << " answers an earlier cancel";
            return;
        }
        // The link dropped before the connect call resolved.
        abandonAttempt(id);
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] " << str(id) << " dropped while connecting";
        failAttempt(id, Condition::ConnectionFailed,
                    error.isEmpty() ? QStringLiteral("Disconnected while connecting") : error);
        return;
    }

    dropLink(id);
    updateRssiTimer();

    if (!error.isEmpty())
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(id) << " disconnected: " << str(error);
    else
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(id) << " disconnected";

    if (registry_->contains(id) && stateOf(id) != ConnectionState::Disconnected)
        setState(id, ConnectionState::Disconnected);
}

// --- Service discovery cascade ---

void ConnectionManager::beginServiceDiscovery(const QString& id)
{
    auto it = links_.find(id);
    if (it == links_.end())
        return;

    LinkState& link = it->second;
    ++link.serviceDiscoveryAttempts;
    link.characteristics.clear();
    link.pendingCharacteristicDiscoveries.clear();

    BOOST_LOG_TRIVIAL(debug) << "[ConnectionManager] Service discovery for " << str(id) << " (attempt "
                             << link.serviceDiscoveryAttempts << "/" << maxServiceDiscoveryAttempts_ << ")";
    setState(id, ConnectionState::ServiceDiscovery);
    radio_->discoverServices(id);
}

void ConnectionManager::onServicesDiscovered(const QString& id, const QList<QBluetoothUuid>& services)
{
    auto it = links_.find(id);
    if (it == links_.end() || stateOf(id) != ConnectionState::ServiceDiscovery)
        return;

    LinkState& link = it->second;
    for (const auto& service : services) {
        if (gatt::isKnownCapability(service) && !link.pendingCharacteristicDiscoveries.contains(service))
            link.pendingCharacteristicDiscoveries.append(service);
    }

    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(id) << " offers " << services.size()
                            << " service(s), " << link.pendingCharacteristicDiscoveries.size() << " known";

    if (link.pendingCharacteristicDiscoveries.isEmpty()) {
        setState(id, ConnectionState::Ready);
        return;
    }

    const QList<QBluetoothUuid> pending = link.pendingCharacteristicDiscoveries;
    for (const auto& service : pending)
        radio_->discoverCharacteristics(id, service);
}

void ConnectionManager::onServiceDiscoveryFailed(const QString& id, const QString& error)
{
    auto it = links_.find(id);
    if (it == links_.end())
        return;

    LinkState& link = it->second;
    if (link.serviceDiscoveryAttempts < maxServiceDiscoveryAttempts_) {
        BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Service discovery for " << str(id) << " failed ("
                                   << str(error) << "), retrying in " << serviceDiscoveryRetryMs_ << " ms";
        link.retryTimer = std::make_unique<QTimer>();
        link.retryTimer->setSingleShot(true);
        connect(link.retryTimer.get(), &QTimer::timeout, this, [this, id]() {
            auto linkIt = links_.find(id);
            if (linkIt == links_.end())
                return;
            linkIt->second.retryTimer.release()->deleteLater();
            beginServiceDiscovery(id);
        });
        link.retryTimer->start(serviceDiscoveryRetryMs_);
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Service discovery for " << str(id)
                               << " gave up after " << link.serviceDiscoveryAttempts << " attempt(s)";
    if (notifications_)
        notifications_->post(Condition::ServiceDiscoveryDegraded, id,
                             QStringLiteral("Device features are unavailable"));
    setState(id, ConnectionState::Connected);
}

void ConnectionManager::onCharacteristicsDiscovered(const QString& id, const QBluetoothUuid& service,
                                                    const QList<CharacteristicInfo>& characteristics)
{
    auto it = links_.find(id);
    if (it == links_.end())
        return;

    LinkState& link = it->second;
    if (!link.pendingCharacteristicDiscoveries.removeOne(service))
        return;
    link.characteristics.insert(service, characteristics);

    for (const auto& ch : characteristics) {
        if (ch.canRead)
            radio_->readCharacteristic(id, service, ch.uuid);
        if (ch.canNotify)
            radio_->setNotify(id, service, ch.uuid, true);
    }

    if (link.pendingCharacteristicDiscoveries.isEmpty() && stateOf(id) == ConnectionState::ServiceDiscovery) {
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(id) << " ready";
        setState(id, ConnectionState::Ready);
    }
}

void ConnectionManager::onCharacteristicValueUpdated(const QString& id, const QBluetoothUuid& /*service*/,
                                                     const QBluetoothUuid& characteristic,
                                                     const QByteArray& value)
{
    auto it = links_.find(id);
    if (value.isEmpty() || it == links_.end())
        return;
    it->second.retriedReads.removeAll(characteristic);

    if (characteristic == gatt::batteryLevel()) {
        registry_->applyBatteryLevel(id, static_cast<quint8>(value.at(0)));
    } else if (characteristic == gatt::manufacturerNameString()) {
        registry_->applyDeviceInformation(id, QString::fromUtf8(value).trimmed(), QString());
    } else if (characteristic == gatt::modelNumberString()) {
        registry_->applyDeviceInformation(id, QString(), QString::fromUtf8(value).trimmed());
    }
}

void ConnectionManager::onCharacteristicError(const QString& id, const QBluetoothUuid& characteristic,
                                              const QString& error)
{
    auto it = links_.find(id);
    if (it != links_.end() && !it->second.retriedReads.contains(characteristic)) {
        if (const auto service = readableService(it->second.characteristics, characteristic)) {
            it->second.retriedReads.append(characteristic);
            BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Read of " << str(characteristic.toString())
                                    << " on " << str(id) << " failed (" << str(error) << "), retrying once";
            radio_->readCharacteristic(id, *service, characteristic);
            return;
        }
    }

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] " << str(id) << " characteristic "
                               << str(characteristic.toString()) << ": " << str(error);
}

void ConnectionManager::onRssiRead(const QString& id, int rssi)
{
    if (links_.count(id) > 0)
        registry_->updateSignalStrength(id, rssi);
}

void ConnectionManager::refreshRssi()
{
    for (const auto& entry : links_)
        radio_->readRssi(entry.first);
}

// --- Environment changes ---

void ConnectionManager::onPowerStateChanged(RadioPowerState state)
{
    if (radio_->isSynthetic() || state == RadioPowerState::PoweredOn)
        return;

    BOOST_LOG_TRIVIAL(warning) << "[ConnectionManager] Radio " << str(toString(state))
                               << ", dropping all connections";

    QStringList pending;
    for (const auto& entry : attempts_)
        pending.append(entry.first);
    for (const auto& id : pending) {
        dropAttempt(id);
        failAttempt(id, Condition::ConnectionFailed,
                    QStringLiteral("Bluetooth is %1").arg(toString(state)));
    }

    QStringList linked;
    for (const auto& entry : links_)
        linked.append(entry.first);
    for (const auto& id : linked)
        dropLink(id);
    staleConnects_.clear();
    pendingCancels_.clear();
    updateRssiTimer();

    for (const auto& device : registry_->devices()) {
        if (device.connectionState != ConnectionState::Disconnected)
            setState(device.id, ConnectionState::Disconnected);
    }
}

void ConnectionManager::onDeviceRemoved(const QString& id)
{
    const bool hadAttempt = abandonAttempt(id);
    const bool hadLink = dropLink(id);
    autoConnectTried_.remove(id);
    updateRssiTimer();

    if (hadAttempt || hadLink) {
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Removed device " << str(id) << " had a live link";
        requestCancel(id);
    }
}

void ConnectionManager::onDeviceDiscovered(const Device& device)
{
    if (!autoConnectSaved_ || device.connectionState != ConnectionState::Disconnected)
        return;
    if (autoConnectTried_.contains(device.id))
        return;

    if (!device.isSaved) {
        // Address rotation brings saved devices back under a new identity.
        const auto previous = registry_->savedDeviceNamed(device.name, device.id);
        if (!previous)
            return;
        BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] " << str(device.id) << " '" << str(device.name)
                                << "' matches saved device " << str(previous->id);
        registry_->toggleSaved(device.id);
    }

    autoConnectTried_.insert(device.id);
    BOOST_LOG_TRIVIAL(info) << "[ConnectionManager] Auto-connecting saved device " << str(device.id);
    connectDevice(device.id);
}

// --- Internals ---

ConnectionState ConnectionManager::stateOf(const QString& id) const
{
    const auto device = registry_->device(id);
    return device ? device->connectionState : ConnectionState::Disconnected;
}

void ConnectionManager::setState(const QString& id, ConnectionState state)
{
    if (registry_->markConnectionState(id, state))
        emit connectionStateChanged(id, state);
}

void ConnectionManager::failAttempt(const QString& id, Condition condition, const QString& message)
{
    setState(id, ConnectionState::Failed);
    setState(id, ConnectionState::Disconnected);
    if (notifications_)
        notifications_->post(condition, id, message);
}

bool ConnectionManager::abandonAttempt(const QString& id)
{
    if (!dropAttempt(id))
        return false;
    ++staleConnects_[id];
    return true;
}

void ConnectionManager::requestCancel(const QString& id)
{
    ++pendingCancels_[id];
    radio_->cancelPeripheralConnection(id);
}

bool ConnectionManager::dropAttempt(const QString& id)
{
    auto it = attempts_.find(id);
    if (it == attempts_.end())
        return false;
    // May run inside the timer's own timeout slot.
    if (it->second.timer) {
        it->second.timer->stop();
        it->second.timer.release()->deleteLater();
    }
    attempts_.erase(it);
    return true;
}

bool ConnectionManager::dropLink(const QString& id)
{
    auto it = links_.find(id);
    if (it == links_.end())
        return false;
    if (it->second.retryTimer) {
        it->second.retryTimer->stop();
        it->second.retryTimer.release()->deleteLater();
    }
    links_.erase(it);
    return true;
}

void ConnectionManager::updateRssiTimer()
{
    if (links_.empty())
        rssiTimer_.stop();
    else if (!rssiTimer_.isActive())
        rssiTimer_.start();
}

const CharacteristicInfo* ConnectionManager::findCharacteristic(const QString& id,
                                                                const QBluetoothUuid& service,
                                                                const QBluetoothUuid& characteristic) const
{
    auto it = links_.find(id);
    if (it == links_.end())
        return nullptr;
    auto serviceIt = it->second.characteristics.constFind(service);
    if (serviceIt == it->second.characteristics.constEnd())
        return nullptr;
    for (const auto& ch : *serviceIt) {
        if (ch.uuid == characteristic)
            return &ch;
    }
    return nullptr;
}

} // namespace ble
} // namespace bdf
