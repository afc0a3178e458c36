#include <QTest>
#include <QSignalSpy>
#include "TestDoubles.hpp"
#include "core/ble/GattUuids.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/services/NotificationService.hpp"

using namespace bdf;

class TestDeviceRegistry : public QObject {
    Q_OBJECT

private slots:
    void firstAdvertisementCreatesDevice()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        QSignalSpy addedSpy(&registry, &DeviceRegistry::deviceAdded);

        Device d = registry.upsertFromDiscovery(makeAdvertisement("AA", "Galaxy Buds2", -60));

        QCOMPARE(addedSpy.count(), 1);
        QCOMPARE(d.id, QString("AA"));
        QCOMPARE(d.name, QString("Galaxy Buds2"));
        QCOMPARE(d.category, DeviceCategory::Headphones);
        QCOMPARE(d.connectionState, ConnectionState::Disconnected);
        QCOMPARE(d.signalQuality, SignalQuality::Good);
        QVERIFY(d.lastSeen.isValid());
        QVERIFY(!d.isSaved);
        QCOMPARE(registry.count(), 1);
    }

    void repeatedAdvertisementsKeepOneRecord()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        QSignalSpy addedSpy(&registry, &DeviceRegistry::deviceAdded);
        QSignalSpy updatedSpy(&registry, &DeviceRegistry::deviceUpdated);

        for (int i = 0; i < 5; ++i)
            registry.upsertFromDiscovery(makeAdvertisement("AA", "Speaker", -60 - i));

        QCOMPARE(registry.count(), 1);
        QCOMPARE(addedSpy.count(), 1);
        QCOMPARE(updatedSpy.count(), 4);
        QCOMPARE(*registry.device("AA")->rssi, -64);
    }

    void signalDowngradeScenario()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);

        Device near = registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -45));
        QCOMPARE(near.signalQuality, SignalQuality::Excellent);

        Device far = registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -70));
        QCOMPARE(far.signalQuality, SignalQuality::Fair);
        QVERIFY(far.estimatedDistance > near.estimatedDistance);
        QCOMPARE(registry.count(), 1);
    }

    void unnamedAdvertisementGetsPlaceholder()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        Device d = registry.upsertFromDiscovery(makeAdvertisement("AA", QString(), -70));
        QCOMPARE(d.name, DeviceRegistry::kPlaceholderName);
        QCOMPARE(d.category, DeviceCategory::Unknown);

        // A later advertisement carrying a name replaces the placeholder.
        d = registry.upsertFromDiscovery(makeAdvertisement("AA", "Bose Speaker", -70));
        QCOMPARE(d.name, QString("Bose Speaker"));
        QCOMPARE(d.category, DeviceCategory::Speaker);

        // ...and a nameless one does not bring it back.
        d = registry.upsertFromDiscovery(makeAdvertisement("AA", QString(), -71));
        QCOMPARE(d.name, QString("Bose Speaker"));
    }

    void categoryNeverRegresses()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Apple Watch", -60));

        Advertisement renamed = makeAdvertisement("AA", "Gizmo", -60);
        Device d = registry.upsertFromDiscovery(renamed);
        QCOMPARE(d.category, DeviceCategory::Watch);

        renamed.data.serviceUuids = {ble::gatt::audioSink()};
        d = registry.upsertFromDiscovery(renamed);
        QCOMPARE(d.category, DeviceCategory::Watch);
    }

    void unusableRssiFallsBack()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        Device d = registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", 127));
        QVERIFY(!d.rssi.has_value());
        QCOMPARE(d.signalQuality, SignalQuality::Unknown);
        QCOMPARE(d.estimatedDistance, 30.0);
    }

    void updateWithoutStrengthKeepsLastReading()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        const Device near = registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -45));

        // BlueZ property changes often carry only name or data fields.
        Advertisement dataOnly = makeAdvertisement("AA", QString(), std::nullopt);
        dataOnly.data.manufacturerData.insert(0x004C, QByteArray("\x02\x15", 2));
        Device d = registry.upsertFromDiscovery(dataOnly);

        QCOMPARE(*d.rssi, -45);
        QCOMPARE(d.signalQuality, SignalQuality::Excellent);
        QCOMPARE(d.estimatedDistance, near.estimatedDistance);

        // A reading that is present but unusable still counts.
        d = registry.upsertFromDiscovery(makeAdvertisement("AA", QString(), 127));
        QVERIFY(!d.rssi.has_value());
        QCOMPARE(d.signalQuality, SignalQuality::Unknown);
    }

    void savedDeviceNamedMatchesOtherIds()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Keys", -60));
        registry.upsertFromDiscovery(makeAdvertisement("BB", "Keys", -60));
        registry.upsertFromDiscovery(makeAdvertisement("CC", QString(), -60));
        registry.upsertFromDiscovery(makeAdvertisement("DD", QString(), -60));
        QVERIFY(!registry.savedDeviceNamed("Keys", "BB"));

        registry.toggleSaved("AA");
        registry.toggleSaved("CC");

        auto match = registry.savedDeviceNamed("Keys", "BB");
        QVERIFY(match.has_value());
        QCOMPARE(match->id, QString("AA"));
        QVERIFY(!registry.savedDeviceNamed("Keys", "AA"));
        QVERIFY(!registry.savedDeviceNamed(DeviceRegistry::kPlaceholderName, "DD"));
    }

    void connectionStateStampsLocation()
    {
        FakeLocationProvider location;
        location.position = Coordinate{52.5, 13.4, QDateTime::currentDateTime()};
        DeviceRegistry registry(nullptr, &location, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        registry.markConnectionState("AA", ConnectionState::Connecting);
        QVERIFY(!registry.device("AA")->location.has_value());

        registry.markConnectionState("AA", ConnectionState::Connected);
        auto d = registry.device("AA");
        QCOMPARE(d->connectionState, ConnectionState::Connected);
        QVERIFY(d->location.has_value());
        QCOMPARE(d->location->latitude, 52.5);

        QVERIFY(!registry.markConnectionState("missing", ConnectionState::Connected).has_value());
    }

    void batteryIsClamped()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        registry.applyBatteryLevel("AA", 150);
        QCOMPARE(*registry.device("AA")->batteryLevel, 100);
        registry.applyBatteryLevel("AA", -5);
        QCOMPARE(*registry.device("AA")->batteryLevel, 0);
        registry.applyBatteryLevel("AA", 42);
        QCOMPARE(*registry.device("AA")->batteryLevel, 42);

        // Unknown id is a no-op.
        registry.applyBatteryLevel("BB", 50);
        QVERIFY(!registry.contains("BB"));
    }

    void toggleSavedTwiceRoundTrips()
    {
        FakePersistence persistence;
        DeviceRegistry registry(nullptr, nullptr, &persistence);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        QCOMPARE(registry.toggleSaved("AA"), std::optional<bool>(true));
        QCOMPARE(persistence.saveCount, 1);
        QCOMPARE(persistence.lastSaved.size(), 1);
        QCOMPARE(persistence.lastSaved.first().id, QString("AA"));

        QCOMPARE(registry.toggleSaved("AA"), std::optional<bool>(false));
        QCOMPARE(persistence.saveCount, 2);
        QVERIFY(persistence.lastSaved.isEmpty());
        QVERIFY(!registry.device("AA")->isSaved);

        QVERIFY(!registry.toggleSaved("missing").has_value());
    }

    void persistenceFailureIsSurfacedWithoutRollback()
    {
        FakePersistence persistence;
        persistence.failWrites = true;
        NotificationService notifications;
        QSignalSpy spy(&notifications, &NotificationService::notificationAdded);
        DeviceRegistry registry(&notifications, nullptr, &persistence);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        registry.toggleSaved("AA");

        QVERIFY(registry.device("AA")->isSaved);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<Notification>().condition, Condition::PersistenceFailure);
    }

    void removeDropsRecordAndPersists()
    {
        FakePersistence persistence;
        DeviceRegistry registry(nullptr, nullptr, &persistence);
        QSignalSpy removedSpy(&registry, &DeviceRegistry::deviceRemoved);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));
        registry.upsertFromDiscovery(makeAdvertisement("BB", "Other", -60));
        registry.toggleSaved("AA");
        registry.toggleSaved("BB");

        QVERIFY(registry.remove("AA"));
        QCOMPARE(removedSpy.count(), 1);
        QVERIFY(!registry.contains("AA"));
        QCOMPARE(persistence.lastSaved.size(), 1);
        QCOMPARE(persistence.lastSaved.first().id, QString("BB"));

        QVERIFY(!registry.remove("AA"));
    }

    void markFoundKeepsConnectionAndSavedState()
    {
        FakeLocationProvider location;
        location.position = Coordinate{1.0, 2.0, QDateTime::currentDateTime()};
        FakePersistence persistence;
        DeviceRegistry registry(nullptr, &location, &persistence);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));
        registry.toggleSaved("AA");
        registry.markConnectionState("AA", ConnectionState::Ready);

        registry.markFound("AA");

        auto d = registry.device("AA");
        QCOMPARE(d->connectionState, ConnectionState::Ready);
        QVERIFY(d->isSaved);
        QVERIFY(d->foundAt.isValid());
        QCOMPARE(d->location->longitude, 2.0);
    }

    void refreshLocationWithoutPositionPostsCondition()
    {
        FakeLocationProvider location;
        NotificationService notifications;
        QSignalSpy spy(&notifications, &NotificationService::notificationAdded);
        DeviceRegistry registry(&notifications, &location, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        QVERIFY(!registry.refreshLocation("AA"));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<Notification>().condition, Condition::LocationUnavailable);

        location.position = Coordinate{10.0, 10.0, QDateTime::currentDateTime()};
        QVERIFY(registry.refreshLocation("AA"));
        QCOMPARE(registry.device("AA")->location->latitude, 10.0);
    }

    void geographicDistance()
    {
        FakeLocationProvider location;
        location.position = Coordinate{1.0, 1.0, QDateTime::currentDateTime()};
        DeviceRegistry registry(nullptr, &location, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));

        QVERIFY(!registry.geographicDistanceTo("AA").has_value());
        registry.markFound("AA");
        location.position = Coordinate{1.5, 1.0, QDateTime::currentDateTime()};
        QCOMPARE(*registry.geographicDistanceTo("AA"), 500.0);
    }

    void ensureDeviceSynthesizesOnce()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        QSignalSpy addedSpy(&registry, &DeviceRegistry::deviceAdded);

        Device d = registry.ensureDevice("CC", "Pixel 7");
        QCOMPARE(d.category, DeviceCategory::Phone);
        QCOMPARE(d.connectionState, ConnectionState::Disconnected);
        registry.ensureDevice("CC", "Renamed");

        QCOMPARE(addedSpy.count(), 1);
        QCOMPARE(registry.device("CC")->name, QString("Pixel 7"));
        QCOMPARE(registry.ensureDevice("DD", QString()).name, DeviceRegistry::kPlaceholderName);
    }

    void loadSavedMarksRecordsSaved()
    {
        FakePersistence persistence;
        Device stored;
        stored.id = "AA";
        stored.name = "Old Headphones";
        stored.category = DeviceCategory::Headphones;
        stored.isSaved = true;
        persistence.stored = {stored};

        DeviceRegistry registry(nullptr, nullptr, &persistence);
        QCOMPARE(registry.loadSaved(), 1);

        auto d = registry.device("AA");
        QVERIFY(d.has_value());
        QVERIFY(d->isSaved);
        QCOMPARE(d->category, DeviceCategory::Headphones);
        QCOMPARE(d->connectionState, ConnectionState::Disconnected);

        // Rediscovery updates the same record.
        registry.upsertFromDiscovery(makeAdvertisement("AA", QString(), -50));
        QCOMPARE(registry.count(), 1);
        QVERIFY(registry.device("AA")->isSaved);
        QCOMPARE(registry.device("AA")->name, QString("Old Headphones"));
    }

    void sortOrders()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("1", "bravo", -80));
        QTest::qWait(5);
        registry.upsertFromDiscovery(makeAdvertisement("2", "Alpha", -40));
        QTest::qWait(5);
        registry.upsertFromDiscovery(makeAdvertisement("3", "charlie", -60));
        registry.upsertFromDiscovery(makeAdvertisement("4", "delta", std::nullopt));

        auto byName = registry.devices();
        QCOMPARE(byName.at(0).name, QString("Alpha"));
        QCOMPARE(byName.at(1).name, QString("bravo"));
        QCOMPARE(byName.at(3).name, QString("delta"));

        auto bySignal = registry.devices(DeviceRegistry::SortOrder::BySignalStrength);
        QCOMPARE(bySignal.at(0).id, QString("2"));
        QCOMPARE(bySignal.at(1).id, QString("3"));
        QCOMPARE(bySignal.at(2).id, QString("1"));
        QCOMPARE(bySignal.at(3).id, QString("4"));

        auto byLastSeen = registry.devices(DeviceRegistry::SortOrder::ByLastSeen);
        QCOMPARE(byLastSeen.last().id, QString("1"));
    }

    void equalSignalTiesBrokenByName()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("1", "Zulu", -60));
        registry.upsertFromDiscovery(makeAdvertisement("2", "Echo", -60));

        auto bySignal = registry.devices(DeviceRegistry::SortOrder::BySignalStrength);
        QCOMPARE(bySignal.at(0).name, QString("Echo"));
        QCOMPARE(bySignal.at(1).name, QString("Zulu"));
    }

    void snapshotsAreIndependentCopies()
    {
        DeviceRegistry registry(nullptr, nullptr, nullptr);
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -60));
        auto before = registry.devices();
        registry.upsertFromDiscovery(makeAdvertisement("AA", "Tag", -90));

        QCOMPARE(*before.first().rssi, -60);
        QCOMPARE(*registry.device("AA")->rssi, -90);
    }
};

QTEST_MAIN(TestDeviceRegistry)
#include "test_device_registry.moc"
