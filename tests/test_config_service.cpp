#include <QtTest>
#include <QDir>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"

class TestConfigService : public QObject {
    Q_OBJECT
private slots:
    void testReadScalarValues();
    void testListValues();
    void testDestinationIsExpanded();
    void testWriteValues();
    void testUnknownKeyIgnored();
    void testSaveCreatesDirectoryAndReloads();
};

void TestConfigService::testReadScalarValues()
{
    rbridge::YamlConfig yaml;
    rbridge::ConfigService svc(&yaml, "/tmp/rbridge_test_cs.yaml");

    QCOMPARE(svc.value("transfer.settle_ms").toInt(), 1000);
    QCOMPARE(svc.value("notifications.max_active").toInt(), 5);
    QCOMPARE(svc.value("logging.level").toString(), QString("info"));
    QVERIFY(!svc.value("nonexistent.key").isValid());
}

void TestConfigService::testListValues()
{
    rbridge::YamlConfig yaml;
    rbridge::ConfigService svc(&yaml, "/tmp/rbridge_test_cs.yaml");

    const QVariant patterns = svc.value("devices.name_patterns");
    QCOMPARE(patterns.typeId(), static_cast<int>(QMetaType::QStringList));
    QCOMPARE(patterns.toStringList(), QStringList({"IC Recorder"}));
    QCOMPARE(svc.value("transfer.temp_patterns").toStringList(),
             QStringList({"*.tmp", "*.partial", "*~"}));
}

void TestConfigService::testDestinationIsExpanded()
{
    rbridge::YamlConfig yaml;
    rbridge::ConfigService svc(&yaml, "/tmp/rbridge_test_cs.yaml");

    QCOMPARE(svc.value("transfer.destination_folder").toString(), QString());
    svc.setValue("transfer.destination_folder", QString("~/Inbox"));
    QCOMPARE(svc.value("transfer.destination_folder").toString(), QDir::homePath() + "/Inbox");
}

void TestConfigService::testWriteValues()
{
    rbridge::YamlConfig yaml;
    rbridge::ConfigService svc(&yaml, "/tmp/rbridge_test_cs.yaml");
    QSignalSpy spy(&svc, &rbridge::ConfigService::configChanged);

    svc.setValue("transfer.settle_ms", 0);
    QCOMPARE(svc.value("transfer.settle_ms").toInt(), 0);

    svc.setValue("devices.name_patterns", QStringList({"VOICE", "DR-"}));
    QCOMPARE(yaml.deviceNamePatterns(), QStringList({"VOICE", "DR-"}));

    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(0).at(0).toString(), QString("transfer.settle_ms"));
}

void TestConfigService::testUnknownKeyIgnored()
{
    rbridge::YamlConfig yaml;
    rbridge::ConfigService svc(&yaml, "/tmp/rbridge_test_cs.yaml");
    QSignalSpy spy(&svc, &rbridge::ConfigService::configChanged);

    svc.setValue("transfer.nope", 3);
    QCOMPARE(spy.count(), 0);
    QVERIFY(!svc.value("transfer.nope").isValid());
}

void TestConfigService::testSaveCreatesDirectoryAndReloads()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("nested/recorder-bridge/config.yaml");

    {
        rbridge::YamlConfig yaml;
        rbridge::ConfigService svc(&yaml, path);
        svc.setValue("transfer.destination_folder", QString("/srv/inbox"));
        svc.setValue("notifications.desktop", false);
        svc.save();
    }

    QVERIFY(QFile::exists(path));

    rbridge::YamlConfig yaml;
    yaml.load(path);
    rbridge::ConfigService svc(&yaml, path);
    QCOMPARE(svc.value("transfer.destination_folder").toString(), QString("/srv/inbox"));
    QCOMPARE(svc.value("notifications.desktop").toBool(), false);
}

QTEST_MAIN(TestConfigService)
#include "test_config_service.moc"
