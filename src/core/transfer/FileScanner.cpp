#include "FileScanner.hpp"
#include "core/services/IConfigService.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QStorageInfo>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace rbridge {

class FileScanner::Worker : public QThread {
public:
    explicit Worker(std::function<void()> job) : job_(std::move(job)) {}

protected:
    void run() override { job_(); }

private:
    std::function<void()> job_;
};

FileScanner::FileScanner(IConfigService* configService, QObject* parent)
    : QObject(parent)
    , configService_(configService)
    , spaceQuery_(&FileScanner::storageAvailable)
{
}

FileScanner::~FileScanner()
{
    if (worker_) {
        interrupt_ = true;
        worker_->wait();
        delete worker_;
    }
}

bool FileScanner::scan(const DetectedDevice& device)
{
    if (scanning_) {
        BOOST_LOG_TRIVIAL(warning) << "[FileScanner] Scan already running, ignoring "
                                   << device.displayName.toStdString();
        return false;
    }

    // Collect the previous worker now that its result has been delivered
    if (worker_) {
        worker_->wait();
        delete worker_;
        worker_ = nullptr;
    }

    scanning_ = true;
    interrupt_ = false;
    const QString destination = configService_
        ? configService_->value("transfer.destination_folder").toString()
        : QString();

    BOOST_LOG_TRIVIAL(info) << "[FileScanner] Scanning " << device.displayName.toStdString()
                            << " at " << device.mountPath.toStdString();
    emit scanStarted(device);

    worker_ = new Worker([this, device, destination]() {
        ScanResult result = performScan(device, destination);
        QMetaObject::invokeMethod(this, [this, device, result]() {
            finishScan(device, result);
        }, Qt::QueuedConnection);
    });
    worker_->start();
    return true;
}

void FileScanner::stopScanning()
{
    if (scanning_)
        interrupt_ = true;
}

void FileScanner::finishScan(const DetectedDevice& device, const ScanResult& result)
{
    scanning_ = false;
    if (result.error) {
        BOOST_LOG_TRIVIAL(error) << "[FileScanner] Scan failed for " << device.displayName.toStdString()
                                 << ": " << result.error->message().toStdString();
        emit scanFailed(device, *result.error);
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[FileScanner] Found " << result.files.size() << " audio files on "
                            << device.displayName.toStdString();
    emit scanCompleted(device, result.files);
}

FileScanner::ScanResult FileScanner::performScan(const DetectedDevice& device, const QString& destination) const
{
    ScanResult result;

    QFileInfo rootInfo(device.mountPath);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        result.error = ScanError::deviceNotAccessible(device.mountPath);
        return result;
    }
    if (!rootInfo.isReadable() || !rootInfo.isExecutable()) {
        result.error = ScanError::permissionDenied(device.mountPath);
        return result;
    }

    bool interrupted = false;
    result.files = findAudioFiles(device.mountPath, &interrupt_, &interrupted);
    if (interrupted) {
        result.files.clear();
        result.error = ScanError::interrupted();
        return result;
    }

    if (result.files.isEmpty() || destination.isEmpty())
        return result;

    qint64 total = 0;
    for (const auto& f : result.files)
        total += f.size;

    qint64 available = spaceQuery_ ? spaceQuery_(destination) : -1;
    if (available < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[FileScanner] Could not determine free space at "
                                   << destination.toStdString() << ", skipping capacity check";
        return result;
    }

    result.error = checkCapacity(total, available);
    if (result.error)
        result.files.clear();
    return result;
}

AudioFileList FileScanner::findAudioFiles(const QString& root,
                                          const std::atomic<bool>* interruptFlag,
                                          bool* interrupted)
{
    AudioFileList files;
    if (interrupted)
        *interrupted = false;

    // Without QDir::Hidden, hidden files are skipped and hidden directories
    // are not descended into. NoSymLinks keeps only regular files. Directories
    // are listed too so that ones the iterator cannot enter get reported.
    QDirIterator it(root, QDir::Files | QDir::Dirs | QDir::NoSymLinks | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (interruptFlag && interruptFlag->load()) {
            if (interrupted)
                *interrupted = true;
            return files;
        }

        it.next();
        QFileInfo info = it.fileInfo();
        if (info.isDir()) {
            if (!info.isReadable() || !info.isExecutable())
                BOOST_LOG_TRIVIAL(warning) << "[FileScanner] Skipping unreadable directory "
                                           << info.filePath().toStdString();
            continue;
        }
        if (!info.isFile())
            continue;

        const QString suffix = info.suffix();
        if (!AudioFile::isSupportedExtension(suffix))
            continue;

        if (!info.isReadable()) {
            BOOST_LOG_TRIVIAL(warning) << "[FileScanner] Skipping unreadable file "
                                       << info.filePath().toStdString();
            continue;
        }

        AudioFile file;
        file.path = info.absoluteFilePath();
        file.name = info.fileName();
        file.size = info.size();
        file.lastModified = info.lastModified();
        if (!file.lastModified.isValid())
            file.lastModified = QDateTime::currentDateTime();
        file.kind = AudioFile::kindForExtension(suffix);
        files.append(file);
    }
    return files;
}

std::optional<ScanError> FileScanner::checkCapacity(qint64 totalBytes, qint64 availableBytes)
{
    const qint64 required = totalBytes + totalBytes / 10;
    if (required > availableBytes)
        return ScanError::insufficientDiskSpace(required, availableBytes);
    return std::nullopt;
}

qint64 FileScanner::storageAvailable(const QString& path)
{
    QStorageInfo storage(path);
    if (!storage.isValid() || !storage.isReady())
        return -1;
    return storage.bytesAvailable();
}

} // namespace rbridge
