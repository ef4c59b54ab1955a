#include "UDisksVolumeWatcher.hpp"
#include <QDebug>
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusMetaType>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDBusReply>
#include <QDBusVariant>
#include <QFileInfo>

namespace rbridge {

namespace {
const QString kService = QStringLiteral("org.freedesktop.UDisks2");
const QString kObjectManager = QStringLiteral("org.freedesktop.DBus.ObjectManager");
const QString kProperties = QStringLiteral("org.freedesktop.DBus.Properties");
const QString kBlock = QStringLiteral("org.freedesktop.UDisks2.Block");
const QString kFilesystem = QStringLiteral("org.freedesktop.UDisks2.Filesystem");
const QString kDrive = QStringLiteral("org.freedesktop.UDisks2.Drive");
const QString kRoot = QStringLiteral("/org/freedesktop/UDisks2");
} // namespace

UDisksVolumeWatcher::UDisksVolumeWatcher(QObject* parent)
    : IVolumeWatcher(parent)
{
}

UDisksVolumeWatcher::~UDisksVolumeWatcher()
{
    stop();
}

void UDisksVolumeWatcher::start()
{
    if (running_) return;

    auto bus = QDBusConnection::systemBus();
    if (!bus.isConnected()) {
        qWarning() << "[UDisks] System bus not available:" << bus.lastError().message();
        return;
    }

    bool ok = bus.connect(kService, QString(), kProperties, "PropertiesChanged",
                          this, SLOT(onPropertiesChanged(QDBusMessage)));
    ok = bus.connect(kService, kRoot, kObjectManager, "InterfacesAdded",
                     this, SLOT(onInterfacesAdded(QDBusMessage))) && ok;
    ok = bus.connect(kService, kRoot, kObjectManager, "InterfacesRemoved",
                     this, SLOT(onInterfacesRemoved(QDBusMessage))) && ok;
    if (!ok)
        qWarning() << "[UDisks] Could not subscribe to all UDisks2 signals:" << bus.lastError().message();
    running_ = true;

    qInfo() << "[UDisks] Watching for volumes";
    enumerateMounted();
}

void UDisksVolumeWatcher::stop()
{
    if (!running_) return;

    auto bus = QDBusConnection::systemBus();
    bus.disconnect(kService, QString(), kProperties, "PropertiesChanged",
                   this, SLOT(onPropertiesChanged(QDBusMessage)));
    bus.disconnect(kService, kRoot, kObjectManager, "InterfacesAdded",
                   this, SLOT(onInterfacesAdded(QDBusMessage)));
    bus.disconnect(kService, kRoot, kObjectManager, "InterfacesRemoved",
                   this, SLOT(onInterfacesRemoved(QDBusMessage)));
    volumes_.clear();
    running_ = false;
    qInfo() << "[UDisks] Stopped";
}

QString UDisksVolumeWatcher::firstMountPoint(const QVariant& mountPoints)
{
    const auto points = qdbus_cast<QList<QByteArray>>(mountPoints);
    for (QByteArray point : points) {
        while (point.endsWith('\0'))
            point.chop(1);
        if (!point.isEmpty())
            return QString::fromLocal8Bit(point);
    }
    return {};
}

UDisksVolumeWatcher::InterfaceMap UDisksVolumeWatcher::readInterfaces(const QDBusArgument& arg)
{
    // a{sa{sv}}: interface -> properties
    InterfaceMap result;
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QString iface;
        QVariantMap props;
        arg >> iface >> props;
        arg.endMapEntry();
        result.insert(iface, props);
    }
    arg.endMap();
    return result;
}

void UDisksVolumeWatcher::enumerateMounted()
{
    QDBusInterface objectManager(kService, kRoot, kObjectManager, QDBusConnection::systemBus());
    QDBusMessage reply = objectManager.call("GetManagedObjects");
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        qWarning() << "[UDisks] GetManagedObjects failed:" << reply.errorMessage();
        return;
    }

    // a{oa{sa{sv}}}: object path -> interfaces
    const QDBusArgument arg = reply.arguments().first().value<QDBusArgument>();
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QDBusObjectPath objPath;
        arg >> objPath;
        InterfaceMap ifaces = readInterfaces(arg);
        arg.endMapEntry();

        if (!ifaces.contains(kFilesystem))
            continue;
        QString mountPath = firstMountPoint(ifaces.value(kFilesystem).value("MountPoints"));
        if (!mountPath.isEmpty())
            handleFilesystem(objPath.path(), mountPath, ifaces.value(kBlock));
    }
    arg.endMap();
}

QVariantMap UDisksVolumeWatcher::blockProperties(const QString& objectPath) const
{
    QDBusInterface props(kService, objectPath, kProperties, QDBusConnection::systemBus());
    QDBusReply<QVariantMap> reply = props.call("GetAll", kBlock);
    if (!reply.isValid()) {
        qWarning() << "[UDisks] Could not read block properties of" << objectPath
                   << ":" << reply.error().message();
        return {};
    }
    return reply.value();
}

void UDisksVolumeWatcher::handleFilesystem(const QString& objectPath, const QString& mountPath,
                                           const QVariantMap& blockProps)
{
    auto it = volumes_.find(objectPath);
    if (it != volumes_.end() && it->mountPath == mountPath)
        return;
    if (it != volumes_.end())
        markUnmounted(objectPath);

    QString label = blockProps.value("IdLabel").toString().trimmed();
    if (label.isEmpty())
        label = QFileInfo(mountPath).fileName();

    Volume volume;
    volume.mountPath = mountPath;
    QString drive = qdbus_cast<QDBusObjectPath>(blockProps.value("Drive")).path();
    if (drive != "/")
        volume.drivePath = drive;
    volumes_.insert(objectPath, volume);

    qInfo() << "[UDisks] Mounted" << label << "at" << mountPath;
    emit volumeMounted(label, mountPath);
}

void UDisksVolumeWatcher::markUnmounted(const QString& objectPath)
{
    auto it = volumes_.find(objectPath);
    if (it == volumes_.end()) return;
    QString mountPath = it->mountPath;
    volumes_.erase(it);
    qInfo() << "[UDisks] Unmounted" << mountPath;
    emit volumeUnmounted(mountPath);
}

void UDisksVolumeWatcher::onPropertiesChanged(const QDBusMessage& message)
{
    const auto args = message.arguments();
    if (args.size() < 2 || args.at(0).toString() != kFilesystem)
        return;

    const QVariantMap changed = qdbus_cast<QVariantMap>(args.at(1));
    if (!changed.contains("MountPoints"))
        return;

    QString mountPath = firstMountPoint(changed.value("MountPoints"));
    if (mountPath.isEmpty())
        markUnmounted(message.path());
    else
        handleFilesystem(message.path(), mountPath, blockProperties(message.path()));
}

void UDisksVolumeWatcher::onInterfacesAdded(const QDBusMessage& message)
{
    const auto args = message.arguments();
    if (args.size() < 2)
        return;

    QString objectPath = qdbus_cast<QDBusObjectPath>(args.at(0)).path();
    InterfaceMap ifaces = readInterfaces(args.at(1).value<QDBusArgument>());
    if (!ifaces.contains(kFilesystem))
        return;

    QString mountPath = firstMountPoint(ifaces.value(kFilesystem).value("MountPoints"));
    if (!mountPath.isEmpty())
        handleFilesystem(objectPath, mountPath, ifaces.value(kBlock));
}

void UDisksVolumeWatcher::onInterfacesRemoved(const QDBusMessage& message)
{
    const auto args = message.arguments();
    if (args.size() < 2)
        return;

    QString objectPath = qdbus_cast<QDBusObjectPath>(args.at(0)).path();
    QStringList removed = qdbus_cast<QStringList>(args.at(1));
    if (removed.contains(kFilesystem))
        markUnmounted(objectPath);
}

void UDisksVolumeWatcher::requestEject(const QString& mountPath, EjectCallback callback)
{
    QString objectPath;
    Volume volume;
    for (auto it = volumes_.cbegin(); it != volumes_.cend(); ++it) {
        if (it->mountPath == mountPath) {
            objectPath = it.key();
            volume = it.value();
            break;
        }
    }
    if (objectPath.isEmpty()) {
        callback(false, QStringLiteral("%1 is not a mounted UDisks volume").arg(mountPath));
        return;
    }

    QDBusMessage msg = QDBusMessage::createMethodCall(kService, objectPath, kFilesystem, "Unmount");
    msg << QVariantMap();
    auto* watcher = new QDBusPendingCallWatcher(QDBusConnection::systemBus().asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, watcher, mountPath, volume, callback](QDBusPendingCallWatcher*) {
        watcher->deleteLater();
        if (watcher->isError()) {
            qWarning() << "[UDisks] Unmount of" << mountPath << "refused:" << watcher->error().message();
            callback(false, watcher->error().message());
            return;
        }
        qInfo() << "[UDisks] Unmounted" << mountPath << "on request";
        if (!volume.drivePath.isEmpty())
            powerOffDrive(volume.drivePath);
        callback(true, QString());
    });
}

void UDisksVolumeWatcher::powerOffDrive(const QString& drivePath)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(kService, drivePath, kDrive, "PowerOff");
    msg << QVariantMap();
    auto* watcher = new QDBusPendingCallWatcher(QDBusConnection::systemBus().asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, drivePath](QDBusPendingCallWatcher*) {
        watcher->deleteLater();
        // Not every drive can be powered off; the volume is already unmounted
        if (watcher->isError())
            qInfo() << "[UDisks] PowerOff of" << drivePath << "skipped:" << watcher->error().message();
    });
}

} // namespace rbridge
