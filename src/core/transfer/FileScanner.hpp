#pragma once

#include <QObject>
#include <QString>
#include <atomic>
#include <functional>
#include <optional>

#include "AudioFile.hpp"
#include "DetectedDevice.hpp"
#include "TransferTypes.hpp"

namespace rbridge {

class IConfigService;

/// Produces the flat list of audio files on one device plus an up-front
/// destination capacity check. Traversal runs on a worker thread; results
/// are delivered on the thread this object lives on. Single-flight.
class FileScanner : public QObject {
    Q_OBJECT
public:
    /// Returns available bytes on the volume holding path, or -1 if unknown.
    using SpaceQuery = std::function<qint64(const QString& path)>;

    explicit FileScanner(IConfigService* configService, QObject* parent = nullptr);
    ~FileScanner() override;

    /// Starts a scan. Returns false (and emits nothing) if one is running.
    bool scan(const DetectedDevice& device);

    /// Asks a running scan to stop; it then reports ScanInterrupted.
    void stopScanning();

    bool isScanning() const { return scanning_; }

    void setSpaceQuery(SpaceQuery query) { spaceQuery_ = std::move(query); }

    /// Recursive traversal: regular, non-hidden files with a supported
    /// extension, in the order the filesystem reports them. Sets *interrupted
    /// if the flag was raised before traversal finished.
    static AudioFileList findAudioFiles(const QString& root,
                                        const std::atomic<bool>* interruptFlag = nullptr,
                                        bool* interrupted = nullptr);

    /// Required = total + 10%. Returns the error if it exceeds available.
    static std::optional<ScanError> checkCapacity(qint64 totalBytes, qint64 availableBytes);

    static qint64 storageAvailable(const QString& path);

signals:
    void scanStarted(const rbridge::DetectedDevice& device);
    void scanCompleted(const rbridge::DetectedDevice& device, const rbridge::AudioFileList& files);
    void scanFailed(const rbridge::DetectedDevice& device, const rbridge::ScanError& error);

private:
    class Worker;

    struct ScanResult {
        AudioFileList files;
        std::optional<ScanError> error;
    };

    ScanResult performScan(const DetectedDevice& device, const QString& destination) const;
    void finishScan(const DetectedDevice& device, const ScanResult& result);

    IConfigService* configService_;
    SpaceQuery spaceQuery_;
    bool scanning_ = false;
    std::atomic<bool> interrupt_{false};
    Worker* worker_ = nullptr;
};

} // namespace rbridge
