#include <QTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include "core/services/JsonDevicePersistence.hpp"

using namespace bdf;

class TestJsonDevicePersistence : public QObject {
    Q_OBJECT

private:
    static Device savedDevice(const QString& id, const QString& name)
    {
        Device d;
        d.id = id;
        d.name = name;
        d.category = DeviceCategory::Headphones;
        d.isSaved = true;
        d.lastSeen = QDateTime::fromString("2026-03-01T10:15:30.250", Qt::ISODateWithMs);
        return d;
    }

private slots:
    void missingFileLoadsEmpty()
    {
        QTemporaryDir dir;
        JsonDevicePersistence store(dir.path() + "/saved_devices.json");
        QVERIFY(store.loadSavedDevices().isEmpty());
    }

    void saveThenLoadKeepsFields()
    {
        QTemporaryDir dir;
        JsonDevicePersistence store(dir.path() + "/nested/saved_devices.json");

        Device full = savedDevice("AA:BB:CC:DD:EE:FF", "AirPods Pro");
        full.batteryLevel = 64;
        Coordinate where;
        where.latitude = 52.52;
        where.longitude = 13.405;
        where.timestamp = full.lastSeen;
        full.location = where;
        full.manufacturerName = "Apple Inc.";
        full.modelNumber = "A2084";

        QVERIFY(store.saveDevices({full, savedDevice("11:22:33:44:55:66", "Magic Keyboard")}));

        const auto loaded = store.loadSavedDevices();
        QCOMPARE(loaded.size(), 2);

        const Device& d = loaded.at(0);
        QCOMPARE(d.id, full.id);
        QCOMPARE(d.name, full.name);
        QCOMPARE(d.category, DeviceCategory::Headphones);
        QVERIFY(d.isSaved);
        QCOMPARE(d.lastSeen, full.lastSeen);
        QCOMPARE(*d.batteryLevel, 64);
        QVERIFY(d.location.has_value());
        QCOMPARE(d.location->latitude, 52.52);
        QCOMPARE(d.location->longitude, 13.405);
        QCOMPARE(d.manufacturerName, QString("Apple Inc."));
        QCOMPARE(d.modelNumber, QString("A2084"));

        // Live fields are not persisted
        QVERIFY(!d.rssi.has_value());
        QCOMPARE(d.connectionState, ConnectionState::Disconnected);
        QVERIFY(!loaded.at(1).batteryLevel.has_value());
        QVERIFY(!loaded.at(1).location.has_value());
    }

    void malformedFileLoadsEmpty()
    {
        QTemporaryDir dir;
        const QString path = dir.path() + "/saved_devices.json";
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("{ not json");
        f.close();

        JsonDevicePersistence store(path);
        QVERIFY(store.loadSavedDevices().isEmpty());
    }

    void entriesWithoutIdAreSkipped()
    {
        QTemporaryDir dir;
        const QString path = dir.path() + "/saved_devices.json";
        QJsonArray arr;
        arr.append(QJsonObject{{"name", "No id"}});
        arr.append(QJsonObject{{"id", "AA"}, {"name", "Tag"}, {"category", "bogus"}, {"battery", 140}});
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(QJsonDocument(arr).toJson());
        f.close();

        JsonDevicePersistence store(path);
        const auto loaded = store.loadSavedDevices();
        QCOMPARE(loaded.size(), 1);
        QCOMPARE(loaded.at(0).id, QString("AA"));
        QCOMPARE(loaded.at(0).category, DeviceCategory::Unknown);
        QCOMPARE(*loaded.at(0).batteryLevel, 100);
        QVERIFY(loaded.at(0).isSaved);
    }

    void unwritablePathFails()
    {
        QTemporaryDir dir;
        const QString blocker = dir.path() + "/file";
        QFile f(blocker);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.close();

        // Parent "directory" is a regular file
        JsonDevicePersistence store(blocker + "/saved_devices.json");
        QVERIFY(!store.saveDevices({savedDevice("AA", "Tag")}));
    }

    void emptyListWritesEmptyArray()
    {
        QTemporaryDir dir;
        const QString path = dir.path() + "/saved_devices.json";
        JsonDevicePersistence store(path);
        QVERIFY(store.saveDevices({}));
        QVERIFY(QFile::exists(path));
        QVERIFY(store.loadSavedDevices().isEmpty());
    }
};

QTEST_MAIN(TestJsonDevicePersistence)
#include "test_json_device_persistence.moc"
