#include "core/devices/Device.hpp"

namespace bdf {

QString toString(DeviceCategory category)
{
    switch (category) {
    case DeviceCategory::Headphones: return QStringLiteral("headphones");
    case DeviceCategory::Speaker:    return QStringLiteral("speaker");
    case DeviceCategory::Watch:      return QStringLiteral("watch");
    case DeviceCategory::Phone:      return QStringLiteral("phone");
    case DeviceCategory::Tablet:     return QStringLiteral("tablet");
    case DeviceCategory::Laptop:     return QStringLiteral("laptop");
    case DeviceCategory::Computer:   return QStringLiteral("computer");
    case DeviceCategory::Keyboard:   return QStringLiteral("keyboard");
    case DeviceCategory::Mouse:      return QStringLiteral("mouse");
    case DeviceCategory::Unknown:    break;
    }
    return QStringLiteral("unknown");
}

QString toString(SignalQuality quality)
{
    switch (quality) {
    case SignalQuality::Excellent: return QStringLiteral("excellent");
    case SignalQuality::Good:      return QStringLiteral("good");
    case SignalQuality::Fair:      return QStringLiteral("fair");
    case SignalQuality::Poor:      return QStringLiteral("poor");
    case SignalQuality::Unknown:   break;
    }
    return QStringLiteral("unknown");
}

QString toString(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:     return QStringLiteral("disconnected");
    case ConnectionState::Connecting:       return QStringLiteral("connecting");
    case ConnectionState::Connected:        return QStringLiteral("connected");
    case ConnectionState::ServiceDiscovery: return QStringLiteral("service-discovery");
    case ConnectionState::Ready:            return QStringLiteral("ready");
    case ConnectionState::Failed:           return QStringLiteral("failed");
    case ConnectionState::Disconnecting:    return QStringLiteral("disconnecting");
    }
    return QStringLiteral("disconnected");
}

DeviceCategory categoryFromString(const QString& value)
{
    static const DeviceCategory all[] = {
        DeviceCategory::Headphones, DeviceCategory::Speaker, DeviceCategory::Watch,
        DeviceCategory::Phone, DeviceCategory::Tablet, DeviceCategory::Laptop,
        DeviceCategory::Computer, DeviceCategory::Keyboard, DeviceCategory::Mouse,
    };
    const QString lower = value.trimmed().toLower();
    for (DeviceCategory c : all) {
        if (toString(c) == lower)
            return c;
    }
    return DeviceCategory::Unknown;
}

} // namespace bdf
