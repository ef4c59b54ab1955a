#include "DeviceMonitor.hpp"
#include "IConfigService.hpp"
#include "IEventBus.hpp"
#include "INotificationService.hpp"
#include "IVolumeWatcher.hpp"
#include "core/transfer/FileScanner.hpp"
#include "core/transfer/FileTransferEngine.hpp"

#include <QPointer>
#include <boost/log/trivial.hpp>

namespace rbridge {

namespace {
constexpr int kTransientTtlMs = 5000;
}

DeviceMonitor::DeviceMonitor(IVolumeWatcher* watcher,
                             FileScanner* scanner,
                             FileTransferEngine* engine,
                             IConfigService* configService,
                             INotificationService* notifications,
                             IEventBus* eventBus,
                             QObject* parent)
    : QObject(parent)
    , watcher_(watcher)
    , scanner_(scanner)
    , engine_(engine)
    , configService_(configService)
    , notifications_(notifications)
    , eventBus_(eventBus)
{
    // Pipeline results stay connected across stop/start so that work already
    // in flight still reports its outcome.
    connect(scanner_, &FileScanner::scanStarted, this, &DeviceMonitor::onScanStarted);
    connect(scanner_, &FileScanner::scanCompleted, this, &DeviceMonitor::onScanCompleted);
    connect(scanner_, &FileScanner::scanFailed, this, &DeviceMonitor::onScanFailed);

    connect(engine_, &FileTransferEngine::transferStarted, this, &DeviceMonitor::onTransferStarted);
    connect(engine_, &FileTransferEngine::transferProgress, this, &DeviceMonitor::onTransferProgress);
    connect(engine_, &FileTransferEngine::transferCompleted, this, &DeviceMonitor::onTransferCompleted);
    connect(engine_, &FileTransferEngine::transferFailed, this, &DeviceMonitor::onTransferFailed);
}

void DeviceMonitor::startMonitoring()
{
    if (monitoring_)
        return;

    monitoring_ = true;
    watcherConnections_ << connect(watcher_, &IVolumeWatcher::volumeMounted,
                                   this, &DeviceMonitor::onVolumeMounted);
    watcherConnections_ << connect(watcher_, &IVolumeWatcher::volumeUnmounted,
                                   this, &DeviceMonitor::onVolumeUnmounted);

    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Monitoring started, patterns: "
                            << configService_->value("devices.name_patterns").toStringList()
                                   .join(", ").toStdString();
    watcher_->start();
}

void DeviceMonitor::stopMonitoring()
{
    if (!monitoring_)
        return;

    monitoring_ = false;
    watcher_->stop();
    for (const auto& c : watcherConnections_)
        disconnect(c);
    watcherConnections_.clear();

    if (scanner_->isScanning())
        scanner_->stopScanning();
    if (engine_->isTransferInProgress())
        BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Transfer still running, it will finish on its own";

    devices_.clear();
    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Monitoring stopped";
}

QList<DetectedDevice> DeviceMonitor::connectedDevices() const
{
    QList<DetectedDevice> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_)
        result.append(entry.device);
    return result;
}

std::optional<DeviceMonitor::DeviceState> DeviceMonitor::deviceState(const QString& identifier) const
{
    auto it = devices_.constFind(identifier);
    if (it == devices_.constEnd())
        return std::nullopt;
    return it->state;
}

bool DeviceMonitor::matchesPattern(const QString& volumeName, const QStringList& patterns)
{
    for (const auto& pattern : patterns) {
        const QString p = pattern.trimmed();
        if (!p.isEmpty() && volumeName.contains(p, Qt::CaseInsensitive))
            return true;
    }
    return false;
}

QString DeviceMonitor::stateName(DeviceState state)
{
    switch (state) {
    case DeviceState::Connected: return QStringLiteral("connected");
    case DeviceState::Scanning: return QStringLiteral("scanning");
    case DeviceState::Transferring: return QStringLiteral("transferring");
    case DeviceState::Idle: return QStringLiteral("idle");
    case DeviceState::Ejecting: return QStringLiteral("ejecting");
    case DeviceState::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

// --- Volume events ---

void DeviceMonitor::onVolumeMounted(const QString& displayName, const QString& mountPath)
{
    const QStringList patterns = configService_->value("devices.name_patterns").toStringList();
    if (!matchesPattern(displayName, patterns))
        return;

    const DetectedDevice device = DetectedDevice::fromVolume(displayName, mountPath);
    if (devices_.contains(device.identifier)) {
        BOOST_LOG_TRIVIAL(debug) << "[DeviceMonitor] Already tracking " << mountPath.toStdString();
        return;
    }

    const quint64 generation = nextGeneration_++;
    devices_.insert(device.identifier, DeviceEntry{device, DeviceState::Connected, generation});
    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Recorder connected: "
                            << displayName.toStdString() << " at " << mountPath.toStdString();

    emit deviceConnected(device);
    emit deviceStateChanged(device.identifier, DeviceState::Connected);
    notify(category::DeviceConnected, device, tr("Recorder Detected"),
           tr("Device '%1' connected and ready for file transfer").arg(displayName));
    publish(QStringLiteral("device/connected"), device);

    if (scanner_->scan(device)) {
        scanGeneration_ = generation;
    } else {
        setState(device.identifier, DeviceState::Failed);
        notify(category::ScanFailed, device, tr("Scan Failed"),
               tr("Another device is being scanned. Reconnect '%1' to try again.").arg(displayName));
        publish(QStringLiteral("scan/failed"), device, {{"reason", QStringLiteral("busy")}});
    }
}

void DeviceMonitor::onVolumeUnmounted(const QString& mountPath)
{
    auto it = devices_.find(mountPath);
    if (it == devices_.end())
        return;

    const DetectedDevice device = it->device;
    devices_.erase(it);
    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Recorder disconnected: " << device.displayName.toStdString();

    emit deviceDisconnected(device);
    notify(category::DeviceDisconnected, device, tr("Recorder Disconnected"),
           tr("Device '%1' has been disconnected").arg(device.displayName));
    publish(QStringLiteral("device/disconnected"), device);
}

// --- Discovery ---

void DeviceMonitor::onScanStarted(const DetectedDevice& device)
{
    if (!isRegistered(device))
        return;

    setState(device.identifier, DeviceState::Scanning);
    notify(category::ScanStarted, device, tr("Scanning Device"),
           tr("Scanning '%1' for audio files...").arg(device.displayName));
    publish(QStringLiteral("scan/started"), device);
}

void DeviceMonitor::onScanCompleted(const DetectedDevice& device, const AudioFileList& files)
{
    if (!isCurrent(device, scanGeneration_)) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Scan finished for departed device "
                                << device.displayName.toStdString() << ", not transferring";
        return;
    }

    qint64 totalBytes = 0;
    for (const auto& f : files)
        totalBytes += f.size;
    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] " << files.size() << " audio files ("
                            << totalBytes << " bytes) on " << device.displayName.toStdString();
    publish(QStringLiteral("scan/completed"), device,
            {{"fileCount", files.size()}, {"totalBytes", totalBytes}});

    if (files.isEmpty()) {
        setState(device.identifier, DeviceState::Idle);
        notify(category::ScanCompleted, device, tr("No Audio Files"),
               tr("No audio files found on '%1'").arg(device.displayName));
        return;
    }

    notify(category::ScanCompleted, device, tr("Audio Files Found"),
           tr("Found %n audio file(s) on '%1'. Starting transfer...", nullptr, int(files.size()))
               .arg(device.displayName));

    // A rejection is reported synchronously through transferFailed.
    if (engine_->transfer(files, device)) {
        transferGeneration_ = scanGeneration_;
        setState(device.identifier, DeviceState::Transferring);
    }
}

void DeviceMonitor::onScanFailed(const DetectedDevice& device, const ScanError& error)
{
    BOOST_LOG_TRIVIAL(error) << "[DeviceMonitor] Scan of " << device.displayName.toStdString()
                             << " failed: " << error.message().toStdString();
    if (!isCurrent(device, scanGeneration_))
        return;

    setState(device.identifier, DeviceState::Failed);
    notify(category::ScanFailed, device, tr("Scan Failed"),
           tr("Could not scan '%1': %2").arg(device.displayName, error.message()));
    publish(QStringLiteral("scan/failed"), device, {{"reason", error.message()}});
}

// --- Transfer ---

void DeviceMonitor::onTransferStarted(const DetectedDevice& device, int totalFiles)
{
    notify(category::TransferStarted, device, tr("Transfer Started"),
           tr("Transferring %n file(s) from '%1'", nullptr, totalFiles).arg(device.displayName));
    publish(QStringLiteral("transfer/started"), device, {{"totalFiles", totalFiles}});
}

void DeviceMonitor::onTransferProgress(const DetectedDevice& device, int currentFile, int totalFiles,
                                       const QString& fileName)
{
    notify(category::TransferProgress, device, tr("Transferring Files"),
           tr("%1/%2: %3").arg(currentFile).arg(totalFiles).arg(fileName));
    publish(QStringLiteral("transfer/progress"), device,
            {{"current", currentFile}, {"total", totalFiles}, {"file", fileName}});
}

void DeviceMonitor::onTransferCompleted(const DetectedDevice& device, const TransferOutcome& outcome)
{
    notifications_->dismiss(QStringLiteral("%1-%2").arg(category::TransferProgress, device.identifier));

    if (outcome.success) {
        notify(category::TransferCompleted, device, tr("Transfer Complete"),
               tr("Successfully transferred %n file(s) from '%1'", nullptr, outcome.transferredCount)
                   .arg(device.displayName));
    } else if (outcome.transferredCount > 0) {
        notify(category::TransferCompleted, device, tr("Transfer Completed with Errors"),
               tr("Transferred %1 of %2 files from '%3' with %4 errors: %5")
                   .arg(outcome.transferredCount)
                   .arg(outcome.totalCount)
                   .arg(device.displayName)
                   .arg(outcome.errors.size())
                   .arg(outcome.errors.value(0)));
    } else {
        notify(category::TransferFailed, device, tr("Transfer Failed"),
               tr("No files were transferred from '%1': %2")
                   .arg(device.displayName, outcome.errors.value(0, outcome.summary)));
    }
    publish(QStringLiteral("transfer/completed"), device,
            {{"success", outcome.success},
             {"transferred", outcome.transferredCount},
             {"total", outcome.totalCount},
             {"errors", outcome.errors},
             {"summary", outcome.summary}});

    if (!isCurrent(device, transferGeneration_)) {
        BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] " << device.displayName.toStdString()
                                << " left or was reattached during the transfer, skipping eject";
        return;
    }

    if (outcome.success && outcome.transferredCount > 0) {
        ejectDevice(device);
    } else {
        setState(device.identifier, DeviceState::Failed);
        BOOST_LOG_TRIVIAL(warning) << "[DeviceMonitor] Leaving " << device.displayName.toStdString()
                                   << " mounted: " << outcome.summary.toStdString();
    }
}

void DeviceMonitor::onTransferFailed(const DetectedDevice& device, const TransferError& error)
{
    BOOST_LOG_TRIVIAL(error) << "[DeviceMonitor] Transfer from " << device.displayName.toStdString()
                             << " failed: " << error.message().toStdString();

    notify(category::TransferFailed, device, tr("Transfer Failed"),
           tr("Transfer from '%1' failed: %2").arg(device.displayName, error.message()));
    publish(QStringLiteral("transfer/failed"), device, {{"reason", error.message()}});

    if (isRegistered(device))
        setState(device.identifier, DeviceState::Failed);
}

// --- Eject ---

void DeviceMonitor::ejectDevice(const DetectedDevice& device)
{
    const quint64 generation = generationOf(device);
    if (generation != 0)
        setState(device.identifier, DeviceState::Ejecting);
    BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Ejecting " << device.displayName.toStdString();

    QPointer<DeviceMonitor> self(this);
    watcher_->requestEject(device.mountPath, [self, device, generation](bool ok, const QString& reason) {
        if (!self)
            return;

        if (ok) {
            BOOST_LOG_TRIVIAL(info) << "[DeviceMonitor] Ejected " << device.displayName.toStdString();
            self->notify(category::EjectCompleted, device, tr("Safe to Remove"),
                         tr("'%1' has been ejected").arg(device.displayName));
            self->publish(QStringLiteral("eject/completed"), device);
            return;
        }

        BOOST_LOG_TRIVIAL(error) << "[DeviceMonitor] Eject of " << device.displayName.toStdString()
                                 << " failed: " << reason.toStdString();
        if (self->isCurrent(device, generation))
            self->setState(device.identifier, DeviceState::Failed);
        self->notify(category::EjectFailed, device, tr("Eject Failed"),
                     tr("Could not eject '%1': %2. Please eject it manually.")
                         .arg(device.displayName, reason));
        self->publish(QStringLiteral("eject/failed"), device, {{"reason", reason}});
    });
}

// --- Helpers ---

bool DeviceMonitor::isCurrent(const DetectedDevice& device, quint64 generation) const
{
    return generation != 0 && generationOf(device) == generation;
}

quint64 DeviceMonitor::generationOf(const DetectedDevice& device) const
{
    auto it = devices_.constFind(device.identifier);
    return it == devices_.constEnd() ? 0 : it->generation;
}

void DeviceMonitor::setState(const QString& identifier, DeviceState state)
{
    auto it = devices_.find(identifier);
    if (it == devices_.end() || it->state == state)
        return;

    BOOST_LOG_TRIVIAL(debug) << "[DeviceMonitor] " << identifier.toStdString() << ": "
                             << stateName(it->state).toStdString() << " -> "
                             << stateName(state).toStdString();
    it->state = state;
    emit deviceStateChanged(identifier, state);
    publish(QStringLiteral("device/state"), it->device, {{"state", stateName(state)}});
}

void DeviceMonitor::notify(const char* categoryName, const DetectedDevice& device,
                           const QString& title, const QString& body)
{
    const QString cat = QString::fromLatin1(categoryName);
    QVariantMap n;
    n["id"] = QStringLiteral("%1-%2").arg(cat, device.identifier);
    n["category"] = cat;
    n["title"] = title;
    n["body"] = body;
    if (cat == category::DeviceConnected || cat == category::DeviceDisconnected
        || cat == category::ScanStarted)
        n["ttlMs"] = kTransientTtlMs;
    notifications_->post(n);
}

void DeviceMonitor::publish(const QString& topic, const DetectedDevice& device, QVariantMap payload)
{
    if (!eventBus_)
        return;
    payload["device"] = device.displayName;
    payload["mountPath"] = device.mountPath;
    eventBus_->publish(topic, payload);
}

} // namespace rbridge
