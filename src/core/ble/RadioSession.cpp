#include "core/ble/RadioSession.hpp"

namespace bdf {
namespace ble {

QString toString(RadioPowerState state)
{
    switch (state) {
    case RadioPowerState::Unknown:      return QStringLiteral("unknown");
    case RadioPowerState::Unsupported:  return QStringLiteral("unsupported");
    case RadioPowerState::Unauthorized: return QStringLiteral("unauthorized");
    case RadioPowerState::PoweredOff:   return QStringLiteral("powered-off");
    case RadioPowerState::PoweredOn:    return QStringLiteral("powered-on");
    case RadioPowerState::Resetting:    return QStringLiteral("resetting");
    }
    return QStringLiteral("unknown");
}

} // namespace ble
} // namespace bdf
