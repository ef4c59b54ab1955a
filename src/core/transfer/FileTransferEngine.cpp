#include "FileTransferEngine.hpp"
#include "FileIntegrity.hpp"
#include "core/services/IConfigService.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <unistd.h>

namespace rbridge {

class FileTransferEngine::Worker : public QThread {
public:
    explicit Worker(std::function<void()> job) : job_(std::move(job)) {}

protected:
    void run() override { job_(); }

private:
    std::function<void()> job_;
};

FileTransferEngine::FileTransferEngine(IConfigService* configService, QObject* parent)
    : QObject(parent)
    , configService_(configService)
    , fileOps_(FileOperations::defaults())
{
}

FileTransferEngine::FileOperations FileTransferEngine::FileOperations::defaults()
{
    FileOperations ops;
    ops.verify = [](const QString& original, const QString& copy, QString* error) {
        return FileIntegrity::verifyCopy(original, copy, error);
    };
    ops.removeSource = [](const QString& path) { return QFile::remove(path); };
    return ops;
}

FileTransferEngine::~FileTransferEngine()
{
    if (worker_) {
        // The file in flight still completes; the rest are skipped
        cancelRequested_ = true;
        worker_->wait();
        delete worker_;
    }
}

void FileTransferEngine::reject(const DetectedDevice& device, const TransferError& error)
{
    BOOST_LOG_TRIVIAL(error) << "[TransferEngine] Transfer from " << device.displayName.toStdString()
                             << " rejected: " << error.message().toStdString();
    emit transferFailed(device, error);
}

bool FileTransferEngine::transfer(const AudioFileList& files, const DetectedDevice& device)
{
    if (inProgress_) {
        reject(device, TransferError::alreadyInProgress());
        return false;
    }

    CycleSettings settings;
    if (configService_) {
        settings.destination = configService_->value("transfer.destination_folder").toString();
        settings.tempPatterns = configService_->value("transfer.temp_patterns").toStringList();
        settings.settleMs = qMax(0, configService_->value("transfer.settle_ms").toInt());
    }

    if (settings.destination.isEmpty()) {
        reject(device, TransferError::noDestination());
        return false;
    }
    QFileInfo destInfo(settings.destination);
    if (!destInfo.exists() || !destInfo.isDir()) {
        reject(device, TransferError::destinationUnreachable(settings.destination));
        return false;
    }

    if (worker_) {
        worker_->wait();
        delete worker_;
        worker_ = nullptr;
    }

    inProgress_ = true;
    cancelRequested_ = false;

    worker_ = new Worker([this, files, device, settings, ops = fileOps_]() {
        TransferOutcome outcome = runCycle(files, device, settings, ops);
        QMetaObject::invokeMethod(this, [this, device, outcome]() {
            finishCycle(device, outcome);
        }, Qt::QueuedConnection);
    });
    worker_->start();
    return true;
}

void FileTransferEngine::cancelTransfer()
{
    if (inProgress_) {
        BOOST_LOG_TRIVIAL(info) << "[TransferEngine] Cancellation requested";
        cancelRequested_ = true;
    }
}

void FileTransferEngine::finishCycle(const DetectedDevice& device, const TransferOutcome& outcome)
{
    inProgress_ = false;
    emit transferCompleted(device, outcome);
}

TransferOutcome FileTransferEngine::runCycle(const AudioFileList& files, const DetectedDevice& device,
                                             const CycleSettings& settings, const FileOperations& ops)
{
    const int total = files.size();
    BOOST_LOG_TRIVIAL(info) << "[TransferEngine] Transferring " << total << " files from "
                            << device.displayName.toStdString() << " to "
                            << settings.destination.toStdString();
    QMetaObject::invokeMethod(this, [this, device, total]() {
        emit transferStarted(device, total);
    }, Qt::QueuedConnection);

    int transferred = 0;
    QStringList errors;

    for (int i = 0; i < total; ++i) {
        if (cancelRequested_) {
            errors.append(TransferError::cancelled().message());
            BOOST_LOG_TRIVIAL(warning) << "[TransferEngine] Cancelled after " << i << " of " << total << " files";
            break;
        }

        const AudioFile& file = files.at(i);
        const QString fileName = file.name;
        QMetaObject::invokeMethod(this, [this, device, i, total, fileName]() {
            emit transferProgress(device, i + 1, total, fileName);
        }, Qt::QueuedConnection);

        FileResult result = moveFile(file, settings.destination, ops);
        if (result.error) {
            errors.append(result.error->message());
        } else {
            ++transferred;
            BOOST_LOG_TRIVIAL(info) << "[TransferEngine] Moved " << fileName.toStdString()
                                    << " -> " << result.destination.toStdString();
        }
    }

    TransferOutcome outcome = TransferOutcome::make(total, transferred, errors);

    BOOST_LOG_TRIVIAL(info) << "[TransferEngine] " << device.displayName.toStdString() << ": "
                            << outcome.summary.toStdString();
    for (int i = 0; i < errors.size(); ++i)
        BOOST_LOG_TRIVIAL(error) << "[TransferEngine]   " << (i + 1) << ". " << errors.at(i).toStdString();

    if (outcome.success) {
        verifyInboxContents(settings.destination, transferred);
        sweepTemporaryFiles(settings.destination, settings.tempPatterns);
        syncFileSystem();
        checkDeviceReachable(device, settings.settleMs);
    }

    return outcome;
}

FileTransferEngine::FileResult FileTransferEngine::moveFile(const AudioFile& file, const QString& destinationDir,
                                                           const FileOperations& ops)
{
    FileResult result;
    const QString target = FileIntegrity::uniqueDestinationPath(destinationDir, file.name);
    const QString partial = FileIntegrity::uniqueDestinationPath(
        destinationDir, QFileInfo(target).fileName() + QLatin1String(PARTIAL_SUFFIX));
    QString reason;

    // copyFile leaves nothing behind on failure
    if (!FileIntegrity::copyFile(file.path, partial, &reason)) {
        BOOST_LOG_TRIVIAL(error) << "[TransferEngine] Copy failed for " << file.path.toStdString()
                                 << ": " << reason.toStdString() << " (original kept)";
        result.error = TransferError::copyFailed(file.name, reason);
        return result;
    }

    if (!QFile::rename(partial, target)) {
        FileIntegrity::removeIfExists(partial);
        BOOST_LOG_TRIVIAL(error) << "[TransferEngine] Could not move " << partial.toStdString()
                                 << " into place (original kept)";
        result.error = TransferError::copyFailed(file.name, QStringLiteral("destination name became unavailable"));
        return result;
    }

    auto verdict = ops.verify(file.path, target, &reason);
    if (verdict != FileIntegrity::VerifyResult::Match) {
        FileIntegrity::removeIfExists(target);
        BOOST_LOG_TRIVIAL(error) << "[TransferEngine] Verification failed for " << file.path.toStdString()
                                 << " (" << static_cast<int>(verdict) << " " << reason.toStdString()
                                 << "), copy removed, original kept";
        result.error = TransferError::verificationFailed(file.name);
        return result;
    }

    result.destination = target;
    if (!ops.removeSource(file.path)) {
        BOOST_LOG_TRIVIAL(error) << "[TransferEngine] DUPLICATE: " << file.name.toStdString()
                                 << " verified at " << target.toStdString()
                                 << " but the original at " << file.path.toStdString()
                                 << " could not be deleted";
        result.error = TransferError::deletionFailed(file.name);
    }
    return result;
}

void FileTransferEngine::verifyInboxContents(const QString& destination, int transferredCount)
{
    QDir inbox(destination);
    if (!inbox.exists()) {
        BOOST_LOG_TRIVIAL(warning) << "[TransferEngine] Final check: inbox " << destination.toStdString()
                                   << " not readable";
        return;
    }

    const QDateTime cutoff = QDateTime::currentDateTime().addSecs(-300);
    int recent = 0;
    for (const QFileInfo& info : inbox.entryInfoList(QDir::Files)) {
        QDateTime created = info.birthTime().isValid() ? info.birthTime() : info.lastModified();
        if (created >= cutoff)
            ++recent;
    }

    if (recent >= transferredCount)
        BOOST_LOG_TRIVIAL(info) << "[TransferEngine] Final check: " << recent << " recent files in inbox";
    else
        BOOST_LOG_TRIVIAL(warning) << "[TransferEngine] Final check: expected " << transferredCount
                                   << " recent files in inbox, found " << recent;
}

void FileTransferEngine::sweepTemporaryFiles(const QString& destination, const QStringList& patterns)
{
    if (patterns.isEmpty())
        return;

    QDir inbox(destination);
    const QStringList stray = inbox.entryList(patterns, QDir::Files | QDir::Hidden);
    for (const QString& name : stray) {
        if (inbox.remove(name))
            BOOST_LOG_TRIVIAL(info) << "[TransferEngine] Removed temporary file " << name.toStdString();
        else
            BOOST_LOG_TRIVIAL(warning) << "[TransferEngine] Could not remove temporary file " << name.toStdString();
    }
}

void FileTransferEngine::syncFileSystem()
{
    ::sync();
    BOOST_LOG_TRIVIAL(debug) << "[TransferEngine] File system sync completed";
}

void FileTransferEngine::checkDeviceReachable(const DetectedDevice& device, int settleMs)
{
    if (QFileInfo::exists(device.mountPath))
        BOOST_LOG_TRIVIAL(info) << "[TransferEngine] " << device.displayName.toStdString() << " ready for ejection";
    else
        BOOST_LOG_TRIVIAL(warning) << "[TransferEngine] " << device.mountPath.toStdString() << " no longer reachable";

    if (settleMs > 0)
        QThread::msleep(static_cast<unsigned long>(settleMs));
}

} // namespace rbridge
