#include "core/devices/DeviceRegistry.hpp"
#include "core/services/IDevicePersistence.hpp"
#include "core/services/ILocationProvider.hpp"
#include "core/services/INotificationService.hpp"
#include <QMutexLocker>
#include <algorithm>
#include <climits>
#include <boost/log/trivial.hpp>

namespace bdf {

const QString DeviceRegistry::kPlaceholderName = QStringLiteral("Unknown Device");

namespace {

void applySignal(Device& d, std::optional<int> rssi, const proximity::Calibration& calibration)
{
    d.rssi = proximity::isUsableRssi(rssi) ? rssi : std::nullopt;
    d.signalQuality = proximity::qualityFor(d.rssi);
    d.estimatedDistance = proximity::estimateDistance(d.rssi, calibration);
}

bool nameLess(const Device& a, const Device& b)
{
    const int cmp = a.name.compare(b.name, Qt::CaseInsensitive);
    if (cmp != 0)
        return cmp < 0;
    return a.id < b.id;
}

} // namespace

DeviceRegistry::DeviceRegistry(INotificationService* notifications,
                               ILocationProvider* location,
                               IDevicePersistence* persistence,
                               const proximity::Calibration& calibration,
                               QObject* parent)
    : QObject(parent)
    , notifications_(notifications)
    , location_(location)
    , persistence_(persistence)
    , calibration_(calibration)
{
}

Device DeviceRegistry::upsertFromDiscovery(const Advertisement& adv)
{
    Device snapshot;
    bool created = false;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(adv.identity);
        if (it == devices_.end()) {
            Device d;
            d.id = adv.identity;
            d.name = adv.data.localName.isEmpty() ? kPlaceholderName : adv.data.localName;
            d.connectionState = ConnectionState::Disconnected;
            it = devices_.insert(adv.identity, d);
            created = true;
        }

        Device& d = it.value();
        if (!adv.data.localName.isEmpty())
            d.name = adv.data.localName;
        if (!adv.handle.isEmpty())
            d.handle = adv.handle;
        // An update without a strength reading keeps the last observed one.
        if (created || adv.rssi.has_value())
            applySignal(d, adv.rssi, calibration_);
        d.lastSeen = QDateTime::currentDateTime();

        // Category never regresses to Unknown once determined.
        if (d.category == DeviceCategory::Unknown) {
            const QString name = d.name == kPlaceholderName ? QString() : d.name;
            d.category = classifier_.classify(adv.data, name);
        }
        snapshot = d;
    }

    if (created) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] New device " << snapshot.id.toStdString()
                                << " '" << snapshot.name.toStdString() << "' ("
                                << toString(snapshot.category).toStdString() << ")";
        emit deviceAdded(snapshot);
    } else {
        emit deviceUpdated(snapshot);
    }
    emit deviceDiscovered(snapshot);
    return snapshot;
}

std::optional<Device> DeviceRegistry::markConnectionState(const QString& id, ConnectionState state)
{
    const bool stamp = state == ConnectionState::Connected;
    const auto position = stamp ? currentPosition() : std::nullopt;

    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return std::nullopt;
        it->connectionState = state;
        it->lastSeen = QDateTime::currentDateTime();
        if (position)
            it->location = position;
        snapshot = *it;
    }

    BOOST_LOG_TRIVIAL(debug) << "[DeviceRegistry] " << id.toStdString() << " -> "
                             << toString(state).toStdString();
    emit deviceUpdated(snapshot);
    return snapshot;
}

void DeviceRegistry::applyBatteryLevel(const QString& id, int percent)
{
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return;
        it->batteryLevel = qBound(0, percent, 100);
        snapshot = *it;
    }
    emit deviceUpdated(snapshot);
}

void DeviceRegistry::applyDeviceInformation(const QString& id, const QString& manufacturer,
                                            const QString& model)
{
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return;
        if (!manufacturer.isEmpty())
            it->manufacturerName = manufacturer;
        if (!model.isEmpty())
            it->modelNumber = model;
        snapshot = *it;
    }
    emit deviceUpdated(snapshot);
}

void DeviceRegistry::updateSignalStrength(const QString& id, int rssi)
{
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return;
        applySignal(*it, rssi, calibration_);
        it->lastSeen = QDateTime::currentDateTime();
        snapshot = *it;
    }
    emit deviceUpdated(snapshot);
}

std::optional<bool> DeviceRegistry::toggleSaved(const QString& id)
{
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return std::nullopt;
        it->isSaved = !it->isSaved;
        snapshot = *it;
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] " << snapshot.id.toStdString()
                            << (snapshot.isSaved ? " saved" : " unsaved");
    emit deviceUpdated(snapshot);
    persistSaved();
    return snapshot.isSaved;
}

bool DeviceRegistry::remove(const QString& id)
{
    bool wasSaved = false;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return false;
        wasSaved = it->isSaved;
        devices_.erase(it);
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] Removed " << id.toStdString();
    emit deviceRemoved(id);
    if (wasSaved)
        persistSaved();
    return true;
}

void DeviceRegistry::markFound(const QString& id)
{
    const auto position = currentPosition();
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return;
        const QDateTime now = QDateTime::currentDateTime();
        if (position)
            it->location = position;
        it->lastSeen = now;
        it->foundAt = now;
        snapshot = *it;
    }
    emit deviceUpdated(snapshot);
}

bool DeviceRegistry::refreshLocation(const QString& id)
{
    if (!contains(id))
        return false;

    const auto position = currentPosition();
    if (!position) {
        if (notifications_)
            notifications_->post(Condition::LocationUnavailable, id,
                                 QStringLiteral("Current location is unavailable"));
        return false;
    }

    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return false;
        it->location = position;
        snapshot = *it;
    }
    emit deviceUpdated(snapshot);
    return true;
}

std::optional<double> DeviceRegistry::geographicDistanceTo(const QString& id) const
{
    if (!location_)
        return std::nullopt;
    const auto here = location_->currentPosition();
    const auto d = device(id);
    if (!here || !d || !d->location)
        return std::nullopt;
    return location_->distanceBetween(*here, *d->location);
}

Device DeviceRegistry::ensureDevice(const QString& id, const QString& name)
{
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it != devices_.end())
            return *it;

        Device d;
        d.id = id;
        d.name = name.isEmpty() ? kPlaceholderName : name;
        d.category = DeviceClassifier::matchNameKeywords(AdvertisementData{}, name)
                         .value_or(DeviceCategory::Unknown);
        applySignal(d, std::nullopt, calibration_);
        d.lastSeen = QDateTime::currentDateTime();
        devices_.insert(id, d);
        snapshot = d;
    }

    BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] Synthesized record for " << id.toStdString();
    emit deviceAdded(snapshot);
    return snapshot;
}

int DeviceRegistry::loadSaved()
{
    if (!persistence_)
        return 0;

    const QList<Device> stored = persistence_->loadSavedDevices();
    QList<Device> added;
    QList<Device> updated;
    {
        QMutexLocker lock(&mutex_);
        for (Device d : stored) {
            auto it = devices_.find(d.id);
            if (it != devices_.end()) {
                it->isSaved = true;
                updated.append(*it);
                continue;
            }
            d.isSaved = true;
            d.connectionState = ConnectionState::Disconnected;
            applySignal(d, std::nullopt, calibration_);
            if (d.name.isEmpty())
                d.name = kPlaceholderName;
            devices_.insert(d.id, d);
            added.append(d);
        }
    }

    for (const auto& d : added)
        emit deviceAdded(d);
    for (const auto& d : updated)
        emit deviceUpdated(d);
    return stored.size();
}

std::optional<Device> DeviceRegistry::device(const QString& id) const
{
    QMutexLocker lock(&mutex_);
    auto it = devices_.constFind(id);
    if (it == devices_.constEnd())
        return std::nullopt;
    return *it;
}

std::optional<Device> DeviceRegistry::savedDeviceNamed(const QString& name, const QString& excludeId) const
{
    if (name.isEmpty() || name == kPlaceholderName)
        return std::nullopt;

    QMutexLocker lock(&mutex_);
    for (const auto& d : devices_) {
        if (d.isSaved && d.id != excludeId && d.name == name)
            return d;
    }
    return std::nullopt;
}

bool DeviceRegistry::contains(const QString& id) const
{
    QMutexLocker lock(&mutex_);
    return devices_.contains(id);
}

int DeviceRegistry::count() const
{
    QMutexLocker lock(&mutex_);
    return devices_.size();
}

QList<Device> DeviceRegistry::devices(SortOrder order) const
{
    QList<Device> result;
    {
        QMutexLocker lock(&mutex_);
        result = devices_.values();
    }

    switch (order) {
    case SortOrder::ByName:
        std::sort(result.begin(), result.end(), nameLess);
        break;
    case SortOrder::BySignalStrength:
        std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
            const int ra = a.rssi.value_or(INT_MIN);
            const int rb = b.rssi.value_or(INT_MIN);
            if (ra != rb)
                return ra > rb;
            return nameLess(a, b);
        });
        break;
    case SortOrder::ByLastSeen:
        std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
            if (a.lastSeen != b.lastSeen)
                return a.lastSeen > b.lastSeen;
            return nameLess(a, b);
        });
        break;
    }
    return result;
}

void DeviceRegistry::persistSaved()
{
    if (!persistence_)
        return;

    QList<Device> saved;
    {
        QMutexLocker lock(&mutex_);
        for (const auto& d : devices_) {
            if (d.isSaved)
                saved.append(d);
        }
    }

    if (!persistence_->saveDevices(saved)) {
        BOOST_LOG_TRIVIAL(error) << "[DeviceRegistry] Failed to persist " << saved.size()
                                 << " saved device(s)";
        if (notifications_)
            notifications_->post(Condition::PersistenceFailure, QString(),
                                 QStringLiteral("Saved devices could not be written"));
    }
}

std::optional<Coordinate> DeviceRegistry::currentPosition() const
{
    if (!location_)
        return std::nullopt;
    return location_->currentPosition();
}

} // namespace bdf
