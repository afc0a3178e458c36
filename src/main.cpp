#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTimer>
#include <memory>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/ble/BluezRadioSession.hpp"
#include "core/ble/ConnectionManager.hpp"
#include "core/ble/ScanController.hpp"
#include "core/ble/SyntheticDiscoverySource.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/devices/ProximityEstimator.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/ConfiguredLocationProvider.hpp"
#include "core/services/JsonDevicePersistence.hpp"
#include "core/services/NotificationService.hpp"

namespace {

void logDeviceTable(const bdf::DeviceRegistry* registry, bool scanning)
{
    const auto devices = registry->devices(bdf::DeviceRegistry::SortOrder::BySignalStrength);
    qInfo().noquote() << QStringLiteral("[Main] %1 device(s)%2")
                             .arg(devices.size())
                             .arg(scanning ? QStringLiteral(", scanning") : QString());
    for (const auto& d : devices) {
        const QString rssi = d.rssi ? QString::number(*d.rssi) : QStringLiteral("--");
        const QString battery = d.batteryLevel ? QStringLiteral("%1%").arg(*d.batteryLevel) : QStringLiteral("--");
        qInfo().noquote() << QStringLiteral("  %1 %2 %3 %4 dBm %5 ~%6 m %7 battery %8%9")
                                 .arg(d.id, -36)
                                 .arg(d.name.left(24), -24)
                                 .arg(bdf::toString(d.category), -10)
                                 .arg(rssi, 4)
                                 .arg(bdf::proximity::describe(d.signalQuality), -10)
                                 .arg(d.estimatedDistance, 0, 'f', 1)
                                 .arg(bdf::toString(d.connectionState), -17)
                                 .arg(battery)
                                 .arg(d.isSaved ? QStringLiteral(" *") : QString());
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("device-finder");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("DeviceFinder");

    QCommandLineParser parser;
    parser.setApplicationDescription("Discovers nearby Bluetooth LE devices and estimates their distance.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "YAML config file.", "path",
                                    QDir::homePath() + "/.devicefinder/config.yaml");
    QCommandLineOption backendOption("backend", "Radio backend: auto, bluez or synthetic.", "name");
    QCommandLineOption intervalOption("list-interval", "Seconds between device table dumps (0 = off).",
                                      "seconds", "5");
    QCommandLineOption connectOption("connect", "Connect to a device id once it is discovered.", "id");
    parser.addOption(configOption);
    parser.addOption(backendOption);
    parser.addOption(intervalOption);
    parser.addOption(connectOption);
    parser.process(app);

    // --- Config ---
    const QString configPath = parser.value(configOption);
    auto yamlConfig = std::make_shared<bdf::YamlConfig>();
    if (QFile::exists(configPath)) {
        try {
            yamlConfig->load(configPath);
        } catch (const YAML::Exception& e) {
            qWarning() << "[Main] Could not load" << configPath << ":" << e.what() << "- using defaults";
        }
    }
    bdf::initLogging(yamlConfig->logLevel());

    auto configService = new bdf::ConfigService(yamlConfig.get(), configPath, &app);

    // --- Services ---
    auto notifications = new bdf::NotificationService(
        bdf::configInt(configService, "notifications.ttl_ms", 8000), &app);
    bdf::ConfiguredLocationProvider location(configService);

    QString savedPath = yamlConfig->savedDevicesPath();
    if (savedPath.isEmpty())
        savedPath = QDir::homePath() + "/.devicefinder/saved_devices.json";
    bdf::JsonDevicePersistence persistence(savedPath);

    bdf::proximity::Calibration calibration;
    calibration.referencePower = yamlConfig->referencePower();
    calibration.pathLossExponent = yamlConfig->pathLossExponent();
    calibration.fallbackDistance = yamlConfig->fallbackDistance();

    auto registry = new bdf::DeviceRegistry(notifications, &location, &persistence, calibration, &app);

    // --- Radio backend, chosen once ---
    QString backend = parser.isSet(backendOption) ? parser.value(backendOption) : yamlConfig->radioBackend();
    if (backend != "auto" && backend != "bluez" && backend != "synthetic") {
        qWarning() << "[Main] Unknown backend" << backend << "- using auto";
        backend = "auto";
    }

    bdf::ble::RadioSession* radio = nullptr;
    if (backend != "synthetic") {
        auto bluez = new bdf::ble::BluezRadioSession(configService, &app);
        bluez->initialize();
        if (backend == "bluez" || bluez->powerState() != bdf::ble::RadioPowerState::Unsupported) {
            radio = bluez;
        } else {
            qInfo() << "[Main] No Bluetooth adapter, falling back to synthetic devices";
            delete bluez;
        }
    }
    if (!radio)
        radio = new bdf::ble::SyntheticDiscoverySource(configService, &app);
    qInfo() << "[Main] Radio backend:" << (radio->isSynthetic() ? "synthetic" : "bluez");

    auto scanner = new bdf::ble::ScanController(radio, registry, notifications, configService, &app);
    auto connections = new bdf::ble::ConnectionManager(radio, registry, notifications, configService, &app);

    const int loaded = registry->loadSaved();
    if (loaded > 0)
        qInfo() << "[Main] Restored" << loaded << "saved device(s)";

    // Optional one-shot connect by id, once the device shows up.
    if (parser.isSet(connectOption)) {
        const QString target = parser.value(connectOption);
        auto once = std::make_shared<QMetaObject::Connection>();
        *once = QObject::connect(registry, &bdf::DeviceRegistry::deviceDiscovered, connections,
                                 [connections, target, once](const bdf::Device& device) {
            if (device.id != target)
                return;
            QObject::disconnect(*once);
            connections->connectDevice(target);
        });
    }

    scanner->startScanning();

    const int intervalSec = parser.value(intervalOption).toInt();
    if (intervalSec > 0) {
        auto listTimer = new QTimer(&app);
        QObject::connect(listTimer, &QTimer::timeout, registry, [registry, scanner]() {
            logDeviceTable(registry, scanner->isScanning());
        });
        listTimer->start(intervalSec * 1000);
    }

    // SIGUSR1 -> restart the scan window; SIGINT/SIGTERM -> clean shutdown
    static bdf::ble::ScanController* g_scanner = scanner;
    signal(SIGUSR1, [](int) {
        QMetaObject::invokeMethod(g_scanner, [](){ g_scanner->startScanning(); },
                                   Qt::QueuedConnection);
    });
    signal(SIGINT, [](int) { QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection); });
    signal(SIGTERM, [](int) { QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection); });

    int ret = app.exec();

    scanner->stopScanning();
    logDeviceTable(registry, false);

    return ret;
}
