#pragma once

#include "IVolumeWatcher.hpp"
#include <QDBusMessage>
#include <QHash>
#include <QVariantMap>

class QDBusArgument;

namespace rbridge {

/// IVolumeWatcher over the UDisks2 D-Bus API on the system bus.
/// A volume "arrives" when a Filesystem object gains a mount point and
/// "departs" when it loses its last one or the object disappears.
class UDisksVolumeWatcher : public IVolumeWatcher {
    Q_OBJECT
public:
    explicit UDisksVolumeWatcher(QObject* parent = nullptr);
    ~UDisksVolumeWatcher() override;

    void start() override;
    void stop() override;
    bool isRunning() const override { return running_; }
    void requestEject(const QString& mountPath, EjectCallback callback) override;

    /// First entry of a UDisks2 MountPoints value (aay, NUL-terminated).
    static QString firstMountPoint(const QVariant& mountPoints);

private slots:
    void onPropertiesChanged(const QDBusMessage& message);
    void onInterfacesAdded(const QDBusMessage& message);
    void onInterfacesRemoved(const QDBusMessage& message);

private:
    struct Volume {
        QString mountPath;
        QString drivePath;  // org.freedesktop.UDisks2.Drive object, may be empty
    };

    using InterfaceMap = QHash<QString, QVariantMap>;

    static InterfaceMap readInterfaces(const QDBusArgument& arg);
    void enumerateMounted();
    void handleFilesystem(const QString& objectPath, const QString& mountPath,
                          const QVariantMap& blockProps);
    void markUnmounted(const QString& objectPath);
    QVariantMap blockProperties(const QString& objectPath) const;
    void powerOffDrive(const QString& drivePath);

    bool running_ = false;
    QHash<QString, Volume> volumes_;  // filesystem object path -> volume
};

} // namespace rbridge
