#include "ui/DeviceListModel.hpp"
#include "core/devices/ProximityEstimator.hpp"

namespace bdf {

DeviceListModel::DeviceListModel(DeviceRegistry* registry, QObject* parent)
    : QAbstractListModel(parent)
    , registry_(registry)
{
    connect(registry_, &DeviceRegistry::deviceAdded, this, &DeviceListModel::onDeviceAdded);
    connect(registry_, &DeviceRegistry::deviceUpdated, this, &DeviceListModel::onDeviceUpdated);
    connect(registry_, &DeviceRegistry::deviceRemoved, this, &DeviceListModel::onDeviceRemoved);
    reload();
}

int DeviceListModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid())
        return 0;
    return devices_.size();
}

QVariant DeviceListModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= devices_.size())
        return {};

    const auto& dev = devices_[index.row()];
    switch (role) {
    case IdRole:
        return dev.id;
    case NameRole:
        return dev.name;
    case CategoryRole:
        return toString(dev.category);
    case RssiRole:
        return dev.rssi ? QVariant(*dev.rssi) : QVariant();
    case SignalQualityRole:
        return toString(dev.signalQuality);
    case ProximityRole:
        return proximity::describe(dev.signalQuality);
    case DistanceRole:
        return dev.estimatedDistance;
    case BatteryRole:
        return dev.batteryLevel ? QVariant(*dev.batteryLevel) : QVariant();
    case ConnectionStateRole:
        return toString(dev.connectionState);
    case ConnectedRole:
        return dev.isConnected();
    case SavedRole:
        return dev.isSaved;
    case LastSeenRole:
        return dev.lastSeen;
    default:
        return {};
    }
}

QHash<int, QByteArray> DeviceListModel::roleNames() const
{
    return {
        {IdRole, "deviceId"},
        {NameRole, "name"},
        {CategoryRole, "category"},
        {RssiRole, "rssi"},
        {SignalQualityRole, "signalQuality"},
        {ProximityRole, "proximity"},
        {DistanceRole, "distance"},
        {BatteryRole, "battery"},
        {ConnectionStateRole, "connectionState"},
        {ConnectedRole, "connected"},
        {SavedRole, "saved"},
        {LastSeenRole, "lastSeen"},
    };
}

void DeviceListModel::setSortOrder(DeviceRegistry::SortOrder order)
{
    if (order == order_)
        return;
    order_ = order;
    reload();
}

void DeviceListModel::reload()
{
    beginResetModel();
    devices_ = registry_->devices(order_);
    endResetModel();
    emit countChanged();
}

void DeviceListModel::onDeviceAdded(const Device& device)
{
    if (rowOf(device.id) >= 0) {
        onDeviceUpdated(device);
        return;
    }
    const int row = devices_.size();
    beginInsertRows({}, row, row);
    devices_.append(device);
    endInsertRows();
    emit countChanged();
}

void DeviceListModel::onDeviceUpdated(const Device& device)
{
    const int row = rowOf(device.id);
    if (row < 0) {
        onDeviceAdded(device);
        return;
    }
    devices_[row] = device;
    QModelIndex idx = index(row, 0);
    emit dataChanged(idx, idx);
}

void DeviceListModel::onDeviceRemoved(const QString& id)
{
    const int row = rowOf(id);
    if (row < 0)
        return;
    beginRemoveRows({}, row, row);
    devices_.removeAt(row);
    endRemoveRows();
    emit countChanged();
}

int DeviceListModel::rowOf(const QString& id) const
{
    for (int i = 0; i < devices_.size(); ++i) {
        if (devices_[i].id == id)
            return i;
    }
    return -1;
}

} // namespace bdf
