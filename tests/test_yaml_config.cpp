#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testUnknownKeysDropped();
    void testLoadMissingFileThrows();
    void testSaveAndReload();
    void testServiceFilterList();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
    void testSetValueByPathRejectsBranch();
};

void TestYamlConfig::testLoadDefaults()
{
    bdf::YamlConfig config;
    QCOMPARE(config.radioBackend(), QString("auto"));
    QCOMPARE(config.scanDurationMs(), 30000);
    QCOMPARE(config.scanWarmupMs(), 10000);
    QCOMPARE(config.connectTimeoutMs(), 12000);
    QCOMPARE(config.maxServiceDiscoveryAttempts(), 3);
    QCOMPARE(config.referencePower(), -59);
    QCOMPARE(config.pathLossExponent(), 2.5);
    QCOMPARE(config.autoConnectSaved(), false);
    QCOMPARE(config.locationSource(), QString("none"));
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFile()
{
    bdf::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QCOMPARE(config.radioBackend(), QString("synthetic"));
    QCOMPARE(config.scanWarmupMs(), 5000);
    QCOMPARE(config.connectTimeoutMs(), 8000);
    QCOMPARE(config.autoConnectSaved(), true);
    QCOMPARE(config.pathLossExponent(), 3.0);
    QCOMPARE(config.logLevel(), QString("debug"));

    // Untouched siblings keep their defaults
    QCOMPARE(config.scanDurationMs(), 30000);
    QCOMPARE(config.rssiRefreshMs(), 2000);
    QCOMPARE(config.referencePower(), -59);
}

void TestYamlConfig::testUnknownKeysDropped()
{
    bdf::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QVERIFY(!config.valueByPath("legacy.theme").isValid());
    QVERIFY(!config.valueByPath("scan_extra").isValid());
}

void TestYamlConfig::testLoadMissingFileThrows()
{
    bdf::YamlConfig config;
    bool threw = false;
    try {
        config.load("/nonexistent/devicefinder.yaml");
    } catch (const YAML::Exception&) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(config.connectTimeoutMs(), 12000);
}

void TestYamlConfig::testSaveAndReload()
{
    bdf::YamlConfig config;
    config.setConnectTimeoutMs(4000);
    config.setRadioAdapter("hci1");
    config.setSavedDevicesPath("/tmp/bdf_saved.json");

    QString tmpPath = QDir::tempPath() + "/bdf_test_config.yaml";
    config.save(tmpPath);

    bdf::YamlConfig loaded;
    loaded.load(tmpPath);
    QCOMPARE(loaded.connectTimeoutMs(), 4000);
    QCOMPARE(loaded.radioAdapter(), QString("hci1"));
    QCOMPARE(loaded.savedDevicesPath(), QString("/tmp/bdf_saved.json"));

    QFile::remove(tmpPath);
}

void TestYamlConfig::testServiceFilterList()
{
    bdf::YamlConfig config;
    QVERIFY(config.scanServiceFilter().contains("180f"));

    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    QCOMPARE(config.scanServiceFilter(), (QStringList{"180f", "1802"}));

    config.setScanServiceFilter({"fe2c"});
    QCOMPARE(config.valueByPath("scan.service_filter").toStringList(), QStringList{"fe2c"});
}

void TestYamlConfig::testValueByPath()
{
    bdf::YamlConfig config;
    QCOMPARE(config.valueByPath("connection.timeout_ms").toInt(), 12000);
    QCOMPARE(config.valueByPath("scan.narrow_after_warmup").toBool(), true);
    QCOMPARE(config.valueByPath("proximity.path_loss_exponent").toDouble(), 2.5);
    QCOMPARE(config.valueByPath("radio.backend").toString(), QString("auto"));
}

void TestYamlConfig::testValueByPathMissing()
{
    bdf::YamlConfig config;
    QVERIFY(!config.valueByPath("").isValid());
    QVERIFY(!config.valueByPath("nonexistent").isValid());
    QVERIFY(!config.valueByPath("connection.nonexistent").isValid());
    QVERIFY(!config.valueByPath("connection.timeout_ms.deeper").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    bdf::YamlConfig config;
    QVERIFY(config.setValueByPath("connection.timeout_ms", 5000));
    QCOMPARE(config.connectTimeoutMs(), 5000);

    QVERIFY(config.setValueByPath("scan.include_unnamed", false));
    QCOMPARE(config.scanIncludeUnnamed(), false);

    QVERIFY(config.setValueByPath("location.source", QString("static")));
    QCOMPARE(config.locationSource(), QString("static"));

    QVERIFY(config.setValueByPath("scan.service_filter", QStringList{"180a"}));
    QCOMPARE(config.scanServiceFilter(), QStringList{"180a"});
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    bdf::YamlConfig config;
    QVERIFY(!config.setValueByPath("", 1));
    QVERIFY(!config.setValueByPath("connection.bogus", 1));
    QVERIFY(!config.setValueByPath("bogus.key", 1));
    QVERIFY(!config.valueByPath("connection.bogus").isValid());
}

void TestYamlConfig::testSetValueByPathRejectsBranch()
{
    bdf::YamlConfig config;
    QVERIFY(!config.setValueByPath("connection", 1));
    QCOMPARE(config.connectTimeoutMs(), 12000);
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
