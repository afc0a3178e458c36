#pragma once

#include <QMetaType>
#include <QString>

namespace bdf {

/// Non-fatal conditions surfaced to the user. None of them abort an
/// operation beyond the one that raised it.
enum class Condition {
    RadioUnavailable,
    ConnectionTimeout,
    ConnectionFailed,
    ServiceDiscoveryDegraded,
    LocationUnavailable,
    PersistenceFailure,
    NotConnected,
    SignalUnsupported
};

QString toString(Condition condition);

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Post a condition. deviceId may be empty for radio-wide conditions.
    /// Returns notification ID.
    virtual QString post(Condition condition, const QString& deviceId, const QString& message) = 0;

    /// Dismiss a notification by ID.
    virtual void dismiss(const QString& notificationId) = 0;
};

} // namespace bdf

Q_DECLARE_METATYPE(bdf::Condition)
