#include "NotificationService.hpp"
#include <QTimer>
#include <QUuid>
#include <boost/log/trivial.hpp>

namespace bdf {

QString toString(Condition condition)
{
    switch (condition) {
    case Condition::RadioUnavailable:         return QStringLiteral("radio-unavailable");
    case Condition::ConnectionTimeout:        return QStringLiteral("connection-timeout");
    case Condition::ConnectionFailed:         return QStringLiteral("connection-failed");
    case Condition::ServiceDiscoveryDegraded: return QStringLiteral("service-discovery-degraded");
    case Condition::LocationUnavailable:      return QStringLiteral("location-unavailable");
    case Condition::PersistenceFailure:       return QStringLiteral("persistence-failure");
    case Condition::NotConnected:             return QStringLiteral("not-connected");
    case Condition::SignalUnsupported:        return QStringLiteral("signal-unsupported");
    }
    return QStringLiteral("unknown");
}

NotificationService::NotificationService(int ttlMs, QObject* parent)
    : QObject(parent), ttlMs_(ttlMs)
{
}

QString NotificationService::post(Condition condition, const QString& deviceId, const QString& message)
{
    Notification n;
    n.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    n.condition = condition;
    n.deviceId = deviceId;
    n.message = message;
    n.timestamp = QDateTime::currentDateTime();
    n.ttlMs = ttlMs_;

    BOOST_LOG_TRIVIAL(warning) << "[Notification] " << toString(condition).toStdString()
                               << (deviceId.isEmpty() ? std::string() : " (" + deviceId.toStdString() + ")")
                               << ": " << message.toStdString();

    notifications_.append(n);
    emit notificationAdded(n);

    if (n.ttlMs > 0) {
        QString id = n.id;
        QTimer::singleShot(n.ttlMs, this, [this, id]() { dismiss(id); });
    }

    return n.id;
}

void NotificationService::dismiss(const QString& notificationId)
{
    for (int i = 0; i < notifications_.size(); ++i) {
        if (notifications_[i].id == notificationId) {
            notifications_.removeAt(i);
            emit notificationRemoved(notificationId);
            return;
        }
    }
}

} // namespace bdf
