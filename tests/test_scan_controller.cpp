#include <QTest>
#include <QSignalSpy>
#include "TestDoubles.hpp"
#include "core/ble/GattUuids.hpp"
#include "core/ble/ScanController.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/services/NotificationService.hpp"

using namespace bdf;
using namespace bdf::ble;

class TestScanController : public QObject {
    Q_OBJECT

private:
    struct Fixture {
        Fixture()
            : registry(&notifications, nullptr, nullptr)
        {
            config.values_["scan.warmup_ms"] = 20;
            config.values_["scan.duration_ms"] = 0;
            config.values_["scan.narrow_after_warmup"] = true;
            config.values_["scan.include_unnamed"] = true;
            config.values_["scan.service_filter"] = QStringList{"180f", "1802",
                "0000fe2c-0000-1000-8000-00805f9b34fb", "not-a-uuid"};
        }

        MockConfigService config;
        NotificationService notifications;
        FakeRadioSession radio;
        DeviceRegistry registry;
    };

private slots:
    void startScanningBeginsBroad();
    void startWhileRadioOffReportsUnavailable();
    void warmupNarrowsToServiceFilter();
    void advertisementsOnlyWhileScanning();
    void unnamedAdvertisementsCanBeFiltered();
    void stopIsIdempotent();
    void durationStopsScan();
    void powerLossStopsScan();
    void resettingDoesNotNotify();
};

void TestScanController::startScanningBeginsBroad()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);
    QSignalSpy spy(&scan, &ScanController::scanningChanged);

    scan.startScanning();
    QVERIFY(scan.isScanning());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(f.radio.discoveryStarts.size(), 1);
    QCOMPARE(f.radio.discoveryStarts.at(0).mode, ScanMode::Broad);

    // Already scanning
    scan.startScanning();
    QCOMPARE(f.radio.discoveryStarts.size(), 1);
    QCOMPARE(spy.count(), 1);
}

void TestScanController::startWhileRadioOffReportsUnavailable()
{
    Fixture f;
    f.radio.state = RadioPowerState::PoweredOff;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);
    QSignalSpy spy(&f.notifications, &NotificationService::notificationAdded);

    scan.startScanning();

    QVERIFY(!scan.isScanning());
    QVERIFY(f.radio.discoveryStarts.isEmpty());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<Notification>().condition, Condition::RadioUnavailable);
    QVERIFY(spy.at(0).at(0).value<Notification>().message.contains("powered-off"));
}

void TestScanController::warmupNarrowsToServiceFilter()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);

    scan.startScanning();
    QTRY_COMPARE(f.radio.discoveryStarts.size(), 2);

    const ScanFilter narrow = f.radio.discoveryStarts.at(1);
    QCOMPARE(narrow.mode, ScanMode::Narrow);
    QCOMPARE(narrow.serviceUuids.size(), 3);
    QVERIFY(narrow.serviceUuids.contains(gatt::batteryService()));
    QVERIFY(narrow.serviceUuids.contains(gatt::immediateAlertService()));
    QVERIFY(narrow.serviceUuids.contains(gatt::googleFastPair()));
    QVERIFY(scan.isScanning());
}

void TestScanController::advertisementsOnlyWhileScanning()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);

    emit f.radio.advertisementReceived(makeAdvertisement("AA", "Tag", -50));
    QCOMPARE(f.registry.count(), 0);

    scan.startScanning();
    emit f.radio.advertisementReceived(makeAdvertisement("AA", "Tag", -50));
    emit f.radio.advertisementReceived(makeAdvertisement("BB", "Tile", -70));
    QCOMPARE(f.registry.count(), 2);

    scan.stopScanning();
    emit f.radio.advertisementReceived(makeAdvertisement("CC", "Late", -70));
    QCOMPARE(f.registry.count(), 2);
}

void TestScanController::unnamedAdvertisementsCanBeFiltered()
{
    Fixture f;
    f.config.values_["scan.include_unnamed"] = false;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);

    scan.startScanning();
    emit f.radio.advertisementReceived(makeAdvertisement("AA", QString(), -50));
    emit f.radio.advertisementReceived(makeAdvertisement("BB", "Named", -50));

    QVERIFY(!f.registry.contains("AA"));
    QVERIFY(f.registry.contains("BB"));
}

void TestScanController::stopIsIdempotent()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);
    QSignalSpy spy(&scan, &ScanController::scanningChanged);

    scan.stopScanning();
    QCOMPARE(f.radio.stopCount, 0);

    scan.startScanning();
    scan.stopScanning();
    scan.stopScanning();
    QCOMPARE(f.radio.stopCount, 1);
    QCOMPARE(spy.count(), 2);

    // Warm-up was cancelled along with the scan.
    QTest::qWait(60);
    QCOMPARE(f.radio.discoveryStarts.size(), 1);
}

void TestScanController::durationStopsScan()
{
    Fixture f;
    f.config.values_["scan.duration_ms"] = 30;
    f.config.values_["scan.narrow_after_warmup"] = false;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);

    scan.startScanning();
    QTRY_VERIFY(!scan.isScanning());
    QCOMPARE(f.radio.stopCount, 1);
    QCOMPARE(f.radio.discoveryStarts.size(), 1);
}

void TestScanController::powerLossStopsScan()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);
    QSignalSpy notes(&f.notifications, &NotificationService::notificationAdded);
    QSignalSpy power(&scan, &ScanController::powerStateChanged);

    scan.startScanning();
    f.radio.setState(RadioPowerState::PoweredOff);

    QVERIFY(!scan.isScanning());
    QCOMPARE(scan.powerState(), RadioPowerState::PoweredOff);
    QCOMPARE(power.count(), 1);
    QCOMPARE(notes.count(), 1);

    // Power returning does not restart the scan on its own.
    f.radio.setState(RadioPowerState::PoweredOn);
    QVERIFY(!scan.isScanning());
    QCOMPARE(f.radio.discoveryStarts.size(), 1);
}

void TestScanController::resettingDoesNotNotify()
{
    Fixture f;
    ScanController scan(&f.radio, &f.registry, &f.notifications, &f.config);
    QSignalSpy notes(&f.notifications, &NotificationService::notificationAdded);

    scan.startScanning();
    f.radio.setState(RadioPowerState::Resetting);

    QVERIFY(!scan.isScanning());
    QCOMPARE(notes.count(), 0);
}

QTEST_MAIN(TestScanController)
#include "test_scan_controller.moc"
