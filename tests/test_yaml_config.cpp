#include <QtTest>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testPartialFileKeepsDefaults();
    void testDestinationTildeExpansion();
    void testSaveAndReload();
    void testMalformedFileThrows();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
};

void TestYamlConfig::testLoadDefaults()
{
    rbridge::YamlConfig config;
    QCOMPARE(config.destinationFolder(), QString());
    QCOMPARE(config.settleMs(), 1000);
    QCOMPARE(config.tempPatterns(), QStringList({"*.tmp", "*.partial", "*~"}));
    QCOMPARE(config.deviceNamePatterns(), QStringList({"IC Recorder"}));
    QCOMPARE(config.maxActiveNotifications(), 5);
    QCOMPARE(config.desktopNotifications(), true);
    QCOMPARE(config.logLevel(), QString("info"));
    QCOMPARE(config.logFile(), QString());
}

void TestYamlConfig::testLoadFromFile()
{
    rbridge::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QCOMPARE(config.settleMs(), 0);
    QCOMPARE(config.deviceNamePatterns(), QStringList({"IC Recorder", "VOICE"}));
    QCOMPARE(config.maxActiveNotifications(), 3);
    QCOMPARE(config.logLevel(), QString("debug"));
}

void TestYamlConfig::testPartialFileKeepsDefaults()
{
    rbridge::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    // Not in the file
    QCOMPARE(config.desktopNotifications(), true);
    QCOMPARE(config.logFile(), QString());

    // Comma-separated scalar instead of a sequence
    QCOMPARE(config.tempPatterns(), QStringList({"*.tmp", "*.bak"}));
}

void TestYamlConfig::testDestinationTildeExpansion()
{
    rbridge::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    QCOMPARE(config.destinationFolder(), QDir::homePath() + "/Recordings/Inbox");

    config.setDestinationFolder("/srv/inbox");
    QCOMPARE(config.destinationFolder(), QString("/srv/inbox"));

    config.setDestinationFolder("~");
    QCOMPARE(config.destinationFolder(), QDir::homePath());
}

void TestYamlConfig::testSaveAndReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("config.yaml");

    rbridge::YamlConfig config;
    config.setDestinationFolder("/srv/inbox");
    config.setDeviceNamePatterns({"DR-05", "ZOOM"});
    config.setSettleMs(250);
    config.setDesktopNotifications(false);
    config.save(path);

    rbridge::YamlConfig reloaded;
    reloaded.load(path);
    QCOMPARE(reloaded.destinationFolder(), QString("/srv/inbox"));
    QCOMPARE(reloaded.deviceNamePatterns(), QStringList({"DR-05", "ZOOM"}));
    QCOMPARE(reloaded.settleMs(), 250);
    QCOMPARE(reloaded.desktopNotifications(), false);
    QCOMPARE(reloaded.tempPatterns(), QStringList({"*.tmp", "*.partial", "*~"}));
}

void TestYamlConfig::testMalformedFileThrows()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("broken.yaml");
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("transfer: [unterminated\n");
    f.close();

    rbridge::YamlConfig config;
    QVERIFY_EXCEPTION_THROWN(config.load(path), YAML::Exception);

    rbridge::YamlConfig missing;
    QVERIFY_EXCEPTION_THROWN(missing.load(dir.filePath("absent.yaml")), YAML::Exception);
}

void TestYamlConfig::testValueByPath()
{
    rbridge::YamlConfig config;
    QCOMPARE(config.valueByPath("transfer.settle_ms").toInt(), 1000);
    QCOMPARE(config.valueByPath("notifications.max_active").toInt(), 5);
    QCOMPARE(config.valueByPath("notifications.desktop").toBool(), true);
    QCOMPARE(config.valueByPath("logging.level").toString(), QString("info"));
}

void TestYamlConfig::testValueByPathMissing()
{
    rbridge::YamlConfig config;
    QVERIFY(!config.valueByPath("nonexistent.key").isValid());
    QVERIFY(!config.valueByPath("transfer.settle_ms.deeper").isValid());
    QVERIFY(!config.valueByPath("").isValid());
    // Sequences are not scalars
    QVERIFY(!config.valueByPath("devices.name_patterns").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    rbridge::YamlConfig config;
    QVERIFY(config.setValueByPath("transfer.settle_ms", 0));
    QCOMPARE(config.settleMs(), 0);

    QVERIFY(config.setValueByPath("logging.level", QString("warning")));
    QCOMPARE(config.logLevel(), QString("warning"));

    QVERIFY(config.setValueByPath("notifications.desktop", false));
    QCOMPARE(config.desktopNotifications(), false);
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    rbridge::YamlConfig config;
    QVERIFY(!config.setValueByPath("transfer.bogus", 1));
    QVERIFY(!config.setValueByPath("transfer", 1));
    QVERIFY(!config.setValueByPath("devices.name_patterns", QString("x")));
    QVERIFY(!config.valueByPath("transfer.bogus").isValid());
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
