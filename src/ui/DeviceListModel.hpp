#pragma once

#include "core/devices/DeviceRegistry.hpp"
#include <QAbstractListModel>
#include <QList>

namespace bdf {

/// List model over the registry for QML and other item-view consumers.
/// Rows are ordered by the chosen sort order at reset time; later
/// additions are appended until the next reset.
class DeviceListModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        NameRole,
        CategoryRole,
        RssiRole,
        SignalQualityRole,
        ProximityRole,
        DistanceRole,
        BatteryRole,
        ConnectionStateRole,
        ConnectedRole,
        SavedRole,
        LastSeenRole
    };

    explicit DeviceListModel(DeviceRegistry* registry, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = {}) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setSortOrder(DeviceRegistry::SortOrder order);
    DeviceRegistry::SortOrder sortOrder() const { return order_; }

    /// Re-reads the registry in the current sort order.
    void reload();

signals:
    void countChanged();

private:
    void onDeviceAdded(const Device& device);
    void onDeviceUpdated(const Device& device);
    void onDeviceRemoved(const QString& id);
    int rowOf(const QString& id) const;

    DeviceRegistry* registry_;
    DeviceRegistry::SortOrder order_ = DeviceRegistry::SortOrder::ByName;
    QList<Device> devices_;
};

} // namespace bdf
