#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>
#include <optional>

#include "AudioFile.hpp"
#include "DetectedDevice.hpp"
#include "FileIntegrity.hpp"
#include "TransferTypes.hpp"

namespace rbridge {

class IConfigService;

/// Moves a discovered file list into the inbox folder, one file at a time:
/// copy, verify (size + SHA-256), and only then delete the source.
///
/// At most one transfer cycle runs per engine. The work happens on a worker
/// thread; every signal is delivered on the thread this object lives on.
class FileTransferEngine : public QObject {
    Q_OBJECT
public:
    static constexpr char PARTIAL_SUFFIX[] = ".partial";

    explicit FileTransferEngine(IConfigService* configService, QObject* parent = nullptr);
    ~FileTransferEngine() override;

    /// Starts a cycle. Returns false after emitting transferFailed when a
    /// cycle is already running or the inbox folder is unset or missing;
    /// no file is touched in that case.
    bool transfer(const AudioFileList& files, const DetectedDevice& device);

    /// Cooperative: observed between files only.
    void cancelTransfer();

    bool isTransferInProgress() const { return inProgress_; }

    struct FileResult {
        QString destination;               // final path, empty if nothing was kept
        std::optional<TransferError> error;
    };

    /// The verify and delete steps of moveFile. defaults() uses
    /// FileIntegrity::verifyCopy and QFile::remove.
    struct FileOperations {
        std::function<FileIntegrity::VerifyResult(const QString& original, const QString& copy, QString* error)> verify;
        std::function<bool(const QString& path)> removeSource;

        static FileOperations defaults();
    };

    /// Takes effect from the next transfer() call.
    void setFileOperations(FileOperations ops) { fileOps_ = std::move(ops); }

    /// Copy, verify, delete for one file. Blocking. The copy is written under
    /// a free "<name>.partial" name and renamed into place, so nothing already
    /// in destinationDir is overwritten or removed. On copy or verification
    /// failure the destination is removed and the source is left untouched.
    static FileResult moveFile(const AudioFile& file, const QString& destinationDir,
                               const FileOperations& ops = FileOperations::defaults());

signals:
    void transferStarted(const rbridge::DetectedDevice& device, int totalFiles);
    void transferProgress(const rbridge::DetectedDevice& device, int currentFile, int totalFiles, const QString& fileName);
    void transferCompleted(const rbridge::DetectedDevice& device, const rbridge::TransferOutcome& outcome);
    void transferFailed(const rbridge::DetectedDevice& device, const rbridge::TransferError& error);

private:
    class Worker;

    struct CycleSettings {
        QString destination;
        QStringList tempPatterns;
        int settleMs = 0;
    };

    TransferOutcome runCycle(const AudioFileList& files, const DetectedDevice& device,
                             const CycleSettings& settings, const FileOperations& ops);
    void finishCycle(const DetectedDevice& device, const TransferOutcome& outcome);
    void reject(const DetectedDevice& device, const TransferError& error);

    // Housekeeping after a fully successful cycle. Best-effort, warnings only.
    static void verifyInboxContents(const QString& destination, int transferredCount);
    static void sweepTemporaryFiles(const QString& destination, const QStringList& patterns);
    static void syncFileSystem();
    static void checkDeviceReachable(const DetectedDevice& device, int settleMs);

    IConfigService* configService_;
    FileOperations fileOps_;
    bool inProgress_ = false;
    std::atomic<bool> cancelRequested_{false};
    Worker* worker_ = nullptr;
};

} // namespace rbridge
