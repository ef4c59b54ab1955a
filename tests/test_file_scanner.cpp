#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <algorithm>
#include <unistd.h>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"
#include "core/transfer/FileScanner.hpp"

using rbridge::AudioFileList;
using rbridge::DetectedDevice;
using rbridge::FileScanner;
using rbridge::ScanError;

static void writeFile(const QString& path, qint64 size)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    QVERIFY(f.write(QByteArray(size, 'x')) == size);
}

static QStringList names(const AudioFileList& files)
{
    QStringList result;
    for (const auto& f : files)
        result << f.name;
    std::sort(result.begin(), result.end());
    return result;
}

class TestFileScanner : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testFindsSupportedFilesRecursively();
    void testSkipsHiddenAndSymlinks();
    void testEmptyDevice();
    void testInterruptFlag();
    void testScanEmitsStartedThenCompleted();
    void testSingleFlight();
    void testMissingRoot();
    void testUnlistableRoot();
    void testUnreadableSubdirectoryIsLogged();
    void testInsufficientSpace();
    void testUnknownSpaceSkipsCheck();
    void testNoDestinationSkipsCheck();
    void testCheckCapacity();

private:
    void buildDevice();

    QTemporaryDir* device_ = nullptr;
    QTemporaryDir* inbox_ = nullptr;
    rbridge::YamlConfig* yaml_ = nullptr;
    rbridge::ConfigService* config_ = nullptr;
};

void TestFileScanner::init()
{
    device_ = new QTemporaryDir;
    inbox_ = new QTemporaryDir;
    yaml_ = new rbridge::YamlConfig;
    yaml_->setDestinationFolder(inbox_->path());
    config_ = new rbridge::ConfigService(yaml_, inbox_->filePath("config.yaml"));
}

void TestFileScanner::cleanup()
{
    delete config_;
    delete yaml_;
    delete inbox_;
    delete device_;
}

// REC001.mp3 (100), FOLDER_A/REC002.WAV (200), FOLDER_A/deep/REC003.lpcm (300)
// plus files that must never be picked up.
void TestFileScanner::buildDevice()
{
    writeFile(device_->filePath("REC001.mp3"), 100);
    writeFile(device_->filePath("FOLDER_A/REC002.WAV"), 200);
    writeFile(device_->filePath("FOLDER_A/deep/REC003.lpcm"), 300);
    writeFile(device_->filePath("notes.txt"), 10);
    writeFile(device_->filePath("REC004.m4a"), 10);
    writeFile(device_->filePath(".hidden.mp3"), 10);
    writeFile(device_->filePath(".Trashes/501/old.mp3"), 10);
}

void TestFileScanner::testFindsSupportedFilesRecursively()
{
    buildDevice();
    const AudioFileList files = FileScanner::findAudioFiles(device_->path());

    QCOMPARE(names(files), QStringList({"REC001.mp3", "REC002.WAV", "REC003.lpcm"}));
    for (const auto& f : files) {
        QVERIFY(QFileInfo(f.path).isAbsolute());
        QVERIFY(f.lastModified.isValid());
        if (f.name == "REC001.mp3") {
            QCOMPARE(f.size, qint64(100));
            QVERIFY(f.isCompressed());
        } else {
            QVERIFY(!f.isCompressed());
        }
    }
}

void TestFileScanner::testSkipsHiddenAndSymlinks()
{
    buildDevice();
    QVERIFY(QFile::link(device_->filePath("REC001.mp3"), device_->filePath("alias.mp3")));
    QVERIFY(QFile::link(device_->filePath("FOLDER_A"), device_->filePath("loop")));

    const AudioFileList files = FileScanner::findAudioFiles(device_->path());
    QCOMPARE(names(files), QStringList({"REC001.mp3", "REC002.WAV", "REC003.lpcm"}));
}

void TestFileScanner::testEmptyDevice()
{
    writeFile(device_->filePath("MSVOICE/readme.txt"), 5);
    QVERIFY(FileScanner::findAudioFiles(device_->path()).isEmpty());
}

void TestFileScanner::testInterruptFlag()
{
    buildDevice();
    std::atomic<bool> flag{true};
    bool interrupted = false;
    const AudioFileList files = FileScanner::findAudioFiles(device_->path(), &flag, &interrupted);
    QVERIFY(interrupted);
    QVERIFY(files.isEmpty());
}

void TestFileScanner::testScanEmitsStartedThenCompleted()
{
    buildDevice();
    FileScanner scanner(config_);
    scanner.setSpaceQuery([](const QString&) { return qint64(1) << 40; });
    QSignalSpy started(&scanner, &FileScanner::scanStarted);
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);
    QSignalSpy failed(&scanner, &FileScanner::scanFailed);

    const auto device = DetectedDevice::fromVolume("IC RECORDER", device_->path());
    QVERIFY(scanner.scan(device));
    QCOMPARE(started.count(), 1);
    QVERIFY(scanner.isScanning());

    QTRY_COMPARE_WITH_TIMEOUT(completed.count(), 1, 5000);
    QCOMPARE(failed.count(), 0);
    QVERIFY(!scanner.isScanning());

    const auto emitted = completed.first();
    QCOMPARE(emitted.at(0).value<DetectedDevice>().mountPath, device_->path());
    QCOMPARE(names(emitted.at(1).value<AudioFileList>()),
             QStringList({"REC001.mp3", "REC002.WAV", "REC003.lpcm"}));
}

void TestFileScanner::testSingleFlight()
{
    buildDevice();
    FileScanner scanner(config_);
    QSignalSpy started(&scanner, &FileScanner::scanStarted);
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);

    const auto device = DetectedDevice::fromVolume("IC RECORDER", device_->path());
    QVERIFY(scanner.scan(device));
    // Completion is only delivered through the event loop, so this is still in flight
    QVERIFY(!scanner.scan(device));
    QCOMPARE(started.count(), 1);

    QTRY_COMPARE_WITH_TIMEOUT(completed.count(), 1, 5000);
    QTest::qWait(50);
    QCOMPARE(completed.count(), 1);

    // Free again
    QVERIFY(scanner.scan(device));
    QTRY_COMPARE_WITH_TIMEOUT(completed.count(), 2, 5000);
}

void TestFileScanner::testMissingRoot()
{
    FileScanner scanner(config_);
    QSignalSpy failed(&scanner, &FileScanner::scanFailed);

    QVERIFY(scanner.scan(DetectedDevice::fromVolume("IC RECORDER", device_->filePath("gone"))));
    QTRY_COMPARE_WITH_TIMEOUT(failed.count(), 1, 5000);

    const auto error = failed.first().at(1).value<ScanError>();
    QCOMPARE(error.kind, ScanError::Kind::DeviceNotAccessible);
    QCOMPARE(error.path, device_->filePath("gone"));
}

void TestFileScanner::testUnlistableRoot()
{
    if (::geteuid() == 0)
        QSKIP("permission bits are not enforced for root");

    buildDevice();
    const QFileDevice::Permissions original = QFile::permissions(device_->path());
    QVERIFY(QFile::setPermissions(device_->path(), QFileDevice::Permissions()));

    FileScanner scanner(config_);
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);
    QSignalSpy failed(&scanner, &FileScanner::scanFailed);
    QVERIFY(scanner.scan(DetectedDevice::fromVolume("IC RECORDER", device_->path())));
    QTRY_COMPARE_WITH_TIMEOUT(failed.count(), 1, 5000);

    QVERIFY(QFile::setPermissions(device_->path(), original));
    QCOMPARE(completed.count(), 0);
    const auto error = failed.first().at(1).value<ScanError>();
    QCOMPARE(error.kind, ScanError::Kind::PermissionDenied);
    QCOMPARE(error.path, device_->path());
}

void TestFileScanner::testUnreadableSubdirectoryIsLogged()
{
    if (::geteuid() == 0)
        QSKIP("permission bits are not enforced for root");

    buildDevice();
    writeFile(device_->filePath("LOCKED/REC009.mp3"), 10);
    const QString locked = device_->filePath("LOCKED");
    const QFileDevice::Permissions original = QFile::permissions(locked);
    QVERIFY(QFile::setPermissions(locked, QFileDevice::Permissions()));

    const QString logPath = inbox_->filePath("scanner.log");
    rbridge::Logging::init("info", logPath);
    const AudioFileList files = FileScanner::findAudioFiles(device_->path());

    QVERIFY(QFile::setPermissions(locked, original));

    // The rest of the tree is still collected
    QCOMPARE(names(files), QStringList({"REC001.mp3", "REC002.WAV", "REC003.lpcm"}));

    QFile log(logPath);
    QVERIFY(log.open(QIODevice::ReadOnly));
    const QByteArray contents = log.readAll();
    QVERIFY(contents.contains("Skipping unreadable directory"));
    QVERIFY(contents.contains(locked.toUtf8()));
}

void TestFileScanner::testInsufficientSpace()
{
    buildDevice();  // 600 bytes of audio -> 660 required
    FileScanner scanner(config_);
    QString queriedPath;
    scanner.setSpaceQuery([&queriedPath](const QString& path) {
        queriedPath = path;
        return qint64(600);
    });
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);
    QSignalSpy failed(&scanner, &FileScanner::scanFailed);

    QVERIFY(scanner.scan(DetectedDevice::fromVolume("IC RECORDER", device_->path())));
    QTRY_COMPARE_WITH_TIMEOUT(failed.count(), 1, 5000);
    QCOMPARE(completed.count(), 0);

    const auto error = failed.first().at(1).value<ScanError>();
    QCOMPARE(error.kind, ScanError::Kind::InsufficientDiskSpace);
    QCOMPARE(error.required, qint64(660));
    QCOMPARE(error.available, qint64(600));
    QCOMPARE(queriedPath, inbox_->path());

    // Nothing was touched on the device
    QVERIFY(QFile::exists(device_->filePath("REC001.mp3")));
}

void TestFileScanner::testUnknownSpaceSkipsCheck()
{
    buildDevice();
    FileScanner scanner(config_);
    scanner.setSpaceQuery([](const QString&) { return qint64(-1); });
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);

    QVERIFY(scanner.scan(DetectedDevice::fromVolume("IC RECORDER", device_->path())));
    QTRY_COMPARE_WITH_TIMEOUT(completed.count(), 1, 5000);
    QCOMPARE(completed.first().at(1).value<AudioFileList>().size(), 3);
}

void TestFileScanner::testNoDestinationSkipsCheck()
{
    buildDevice();
    yaml_->setDestinationFolder(QString());
    FileScanner scanner(config_);
    bool queried = false;
    scanner.setSpaceQuery([&queried](const QString&) {
        queried = true;
        return qint64(0);
    });
    QSignalSpy completed(&scanner, &FileScanner::scanCompleted);

    QVERIFY(scanner.scan(DetectedDevice::fromVolume("IC RECORDER", device_->path())));
    QTRY_COMPARE_WITH_TIMEOUT(completed.count(), 1, 5000);
    QVERIFY(!queried);
}

void TestFileScanner::testCheckCapacity()
{
    QVERIFY(!FileScanner::checkCapacity(1000, 1100).has_value());
    QVERIFY(FileScanner::checkCapacity(1000, 1099).has_value());
    QVERIFY(!FileScanner::checkCapacity(0, 0).has_value());

    // Scenario: 100 MB of recordings, 50 MB free
    const qint64 mb = 1024 * 1024;
    auto error = FileScanner::checkCapacity(100 * mb, 50 * mb);
    QVERIFY(error.has_value());
    QCOMPARE(error->required, 110 * mb);
    QCOMPARE(error->available, 50 * mb);
}

QTEST_MAIN(TestFileScanner)
#include "test_file_scanner.moc"
