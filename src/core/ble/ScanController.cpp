#include "core/ble/ScanController.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/services/IConfigService.hpp"
#include "core/services/INotificationService.hpp"
#include <boost/log/trivial.hpp>

namespace bdf {
namespace ble {

ScanController::ScanController(RadioSession* radio, DeviceRegistry* registry,
                               INotificationService* notifications, IConfigService* config,
                               QObject* parent)
    : QObject(parent)
    , radio_(radio)
    , registry_(registry)
    , notifications_(notifications)
    , config_(config)
{
    session_.radioPowerState = radio_->powerState();

    warmupTimer_.setSingleShot(true);
    durationTimer_.setSingleShot(true);
    connect(&warmupTimer_, &QTimer::timeout, this, &ScanController::onWarmupElapsed);
    connect(&durationTimer_, &QTimer::timeout, this, [this]() {
        BOOST_LOG_TRIVIAL(info) << "[ScanController] Scan duration reached, stopping";
        stopScanning();
    });

    connect(radio_, &RadioSession::powerStateChanged, this, &ScanController::onPowerStateChanged);
    connect(radio_, &RadioSession::advertisementReceived, this, &ScanController::onAdvertisement);
}

void ScanController::startScanning()
{
    if (session_.active)
        return;

    session_.radioPowerState = radio_->powerState();
    if (session_.radioPowerState != RadioPowerState::PoweredOn) {
        BOOST_LOG_TRIVIAL(warning) << "[ScanController] Cannot scan, radio is "
                                   << toString(session_.radioPowerState).toStdString();
        reportUnavailable(session_.radioPowerState);
        return;
    }

    ScanFilter broad;
    broad.mode = ScanMode::Broad;
    radio_->startDiscovery(broad);

    session_.active = true;
    BOOST_LOG_TRIVIAL(info) << "[ScanController] Scanning started";
    emit scanningChanged(true);

    if (configBool(config_, "scan.narrow_after_warmup", true))
        warmupTimer_.start(configInt(config_, "scan.warmup_ms", 10000));
    const int durationMs = configInt(config_, "scan.duration_ms", 30000);
    if (durationMs > 0)
        durationTimer_.start(durationMs);
}

void ScanController::stopScanning()
{
    warmupTimer_.stop();
    durationTimer_.stop();
    if (!session_.active)
        return;

    session_.active = false;
    radio_->stopDiscovery();
    BOOST_LOG_TRIVIAL(info) << "[ScanController] Scanning stopped";
    emit scanningChanged(false);
}

void ScanController::onWarmupElapsed()
{
    if (!session_.active)
        return;

    ScanFilter narrow;
    narrow.mode = ScanMode::Narrow;
    narrow.serviceUuids = serviceFilter();
    if (narrow.serviceUuids.isEmpty())
        return;

    BOOST_LOG_TRIVIAL(info) << "[ScanController] Warm-up done, narrowing to "
                            << narrow.serviceUuids.size() << " service(s)";
    radio_->startDiscovery(narrow);
}

void ScanController::onPowerStateChanged(RadioPowerState state)
{
    if (state == session_.radioPowerState)
        return;

    BOOST_LOG_TRIVIAL(info) << "[ScanController] Radio " << toString(session_.radioPowerState).toStdString()
                            << " -> " << toString(state).toStdString();
    session_.radioPowerState = state;

    if (state != RadioPowerState::PoweredOn && session_.active)
        stopScanning();

    if (state == RadioPowerState::PoweredOff || state == RadioPowerState::Unauthorized
        || state == RadioPowerState::Unsupported)
        reportUnavailable(state);

    emit powerStateChanged(state);
}

void ScanController::onAdvertisement(const Advertisement& advertisement)
{
    if (!session_.active || advertisement.identity.isEmpty())
        return;
    if (advertisement.data.localName.isEmpty() && !configBool(config_, "scan.include_unnamed", true))
        return;
    registry_->upsertFromDiscovery(advertisement);
}

void ScanController::reportUnavailable(RadioPowerState state)
{
    if (!notifications_)
        return;
    notifications_->post(Condition::RadioUnavailable, QString(),
                         QStringLiteral("Bluetooth is %1").arg(toString(state)));
}

QList<QBluetoothUuid> ScanController::serviceFilter() const
{
    QList<QBluetoothUuid> result;
    if (!config_)
        return result;
    for (const auto& entry : config_->value("scan.service_filter").toStringList()) {
        bool ok = false;
        const quint16 shortUuid = static_cast<quint16>(entry.toUInt(&ok, 16));
        if (ok && entry.size() <= 4) {
            result.append(QBluetoothUuid(shortUuid));
            continue;
        }
        QBluetoothUuid uuid(entry);
        if (!uuid.isNull())
            result.append(uuid);
        else
            BOOST_LOG_TRIVIAL(warning) << "[ScanController] Ignoring bad service uuid '"
                                       << entry.toStdString() << "'";
    }
    return result;
}

} // namespace ble
} // namespace bdf
