#pragma once

#include <QHash>
#include <QList>
#include <QObject>
#include <QStringList>
#include <QVariantMap>
#include <optional>

#include "core/transfer/AudioFile.hpp"
#include "core/transfer/DetectedDevice.hpp"
#include "core/transfer/TransferTypes.hpp"

namespace rbridge {

class IConfigService;
class IEventBus;
class INotificationService;
class IVolumeWatcher;
class FileScanner;
class FileTransferEngine;

/// Keeps the registry of attached recorder volumes and drives
/// scan -> transfer -> eject for each one that arrives.
///
/// Per device: Connected -> Scanning -> {Transferring | Idle}
///             -> {Ejecting -> (removed) | Failed}.
/// Only one transfer runs at a time; a device whose transfer is rejected
/// because another is running ends in Failed and is picked up again only
/// when it is reattached. There is no queue.
///
/// Scan and transfer results are applied only to the registration that
/// started them. A volume that leaves and comes back at the same path is a
/// new registration, so a cycle left over from its previous visit can
/// neither eject it nor change its state.
///
/// All registry mutation happens on the thread this object lives on.
class DeviceMonitor : public QObject {
    Q_OBJECT
public:
    enum class DeviceState {
        Connected,
        Scanning,
        Transferring,
        Idle,
        Ejecting,
        Failed
    };
    Q_ENUM(DeviceState)

    DeviceMonitor(IVolumeWatcher* watcher,
                  FileScanner* scanner,
                  FileTransferEngine* engine,
                  IConfigService* configService,
                  INotificationService* notifications,
                  IEventBus* eventBus = nullptr,
                  QObject* parent = nullptr);

    /// Idempotent.
    void startMonitoring();
    /// Idempotent. Clears the registry; a running transfer finishes on its own.
    void stopMonitoring();
    bool isMonitoring() const { return monitoring_; }

    /// Unmount the device's volume. Issued automatically after a fully
    /// successful transfer; a refusal is reported and the device stays mounted.
    void ejectDevice(const DetectedDevice& device);

    QList<DetectedDevice> connectedDevices() const;
    bool isDeviceConnected() const { return !devices_.isEmpty(); }
    std::optional<DeviceState> deviceState(const QString& identifier) const;

    /// Case-insensitive substring match; empty patterns never match.
    static bool matchesPattern(const QString& volumeName, const QStringList& patterns);
    static QString stateName(DeviceState state);

signals:
    void deviceConnected(const rbridge::DetectedDevice& device);
    void deviceDisconnected(const rbridge::DetectedDevice& device);
    void deviceStateChanged(const QString& identifier, rbridge::DeviceMonitor::DeviceState state);

private:
    struct DeviceEntry {
        DetectedDevice device;
        DeviceState state = DeviceState::Connected;
        quint64 generation = 0;
    };

    void onVolumeMounted(const QString& displayName, const QString& mountPath);
    void onVolumeUnmounted(const QString& mountPath);

    void onScanStarted(const DetectedDevice& device);
    void onScanCompleted(const DetectedDevice& device, const AudioFileList& files);
    void onScanFailed(const DetectedDevice& device, const ScanError& error);

    void onTransferStarted(const DetectedDevice& device, int totalFiles);
    void onTransferProgress(const DetectedDevice& device, int currentFile, int totalFiles, const QString& fileName);
    void onTransferCompleted(const DetectedDevice& device, const TransferOutcome& outcome);
    void onTransferFailed(const DetectedDevice& device, const TransferError& error);

    bool isRegistered(const DetectedDevice& device) const { return devices_.contains(device.identifier); }
    bool isCurrent(const DetectedDevice& device, quint64 generation) const;
    quint64 generationOf(const DetectedDevice& device) const;
    void setState(const QString& identifier, DeviceState state);
    void notify(const char* categoryName, const DetectedDevice& device,
                const QString& title, const QString& body);
    void publish(const QString& topic, const DetectedDevice& device, QVariantMap payload = {});

    IVolumeWatcher* watcher_;
    FileScanner* scanner_;
    FileTransferEngine* engine_;
    IConfigService* configService_;
    INotificationService* notifications_;
    IEventBus* eventBus_;

    bool monitoring_ = false;
    QList<QMetaObject::Connection> watcherConnections_;
    QHash<QString, DeviceEntry> devices_;  // identifier -> entry
    quint64 nextGeneration_ = 1;
    quint64 scanGeneration_ = 0;      // registration the running scan belongs to
    quint64 transferGeneration_ = 0;  // same for the running transfer
};

} // namespace rbridge
