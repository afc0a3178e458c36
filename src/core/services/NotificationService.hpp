#pragma once

#include "INotificationService.hpp"
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QObject>

namespace bdf {

struct Notification {
    QString id;
    Condition condition = Condition::RadioUnavailable;
    QString deviceId;
    QString message;
    QDateTime timestamp;
    int ttlMs = 0;      // 0 = persistent until dismissed
};

class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    explicit NotificationService(int ttlMs = 0, QObject* parent = nullptr);

    QString post(Condition condition, const QString& deviceId, const QString& message) override;
    void dismiss(const QString& notificationId) override;

    QList<Notification> active() const { return notifications_; }

signals:
    void notificationAdded(const bdf::Notification& n);
    void notificationRemoved(const QString& id);

private:
    int ttlMs_;
    QList<Notification> notifications_;
};

} // namespace bdf

Q_DECLARE_METATYPE(bdf::Notification)
