#include "DesktopNotifier.hpp"

#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>
#include <QPointer>
#include <QTimer>
#include <QVariantMap>

namespace rbridge {

namespace {
const QString kService = QStringLiteral("org.freedesktop.Notifications");
const QString kPath = QStringLiteral("/org/freedesktop/Notifications");
const QString kInterface = QStringLiteral("org.freedesktop.Notifications");
const QString kAppName = QStringLiteral("Recorder Bridge");
const QString kIcon = QStringLiteral("audio-input-microphone");
} // namespace

DesktopNotifier::DesktopNotifier(NotificationService* source, QObject* parent)
    : QObject(parent)
{
    connect(source, &NotificationService::notificationAdded, this, &DesktopNotifier::show);
    connect(source, &NotificationService::notificationRemoved, this, &DesktopNotifier::close);
}

DesktopNotifier::Urgency DesktopNotifier::urgencyFor(const QString& category)
{
    if (category == category::TransferProgress || category == category::ScanStarted)
        return Low;
    if (category.endsWith(QStringLiteral("-failed")))
        return Critical;
    return Normal;
}

void DesktopNotifier::show(const Notification& n)
{
    if (!enabled_)
        return;

    Entry& entry = entries_[n.id];
    entry.closeRequested = false;
    if (entry.inFlight) {
        entry.queued = n;
        return;
    }
    dispatch(n);
}

void DesktopNotifier::dispatch(const Notification& n)
{
    Entry& entry = entries_[n.id];
    entry.inFlight = true;
    const uint replacesId = entry.serverId;
    const QString id = n.id;
    QPointer<DesktopNotifier> self(this);
    sendNotify(n, replacesId, [self, id](uint serverId) {
        if (self)
            self->onNotifyReply(id, serverId);
    });
}

void DesktopNotifier::onNotifyReply(const QString& id, uint serverId)
{
    auto it = entries_.find(id);
    if (it == entries_.end())
        return;

    it->inFlight = false;
    if (serverId != 0)
        it->serverId = serverId;

    if (it->queued) {
        const Notification next = *it->queued;
        it->queued.reset();
        dispatch(next);
        return;
    }
    closeIfRequested(id);
}

// A replaced notification is removed and re-added in one go, so the close is
// deferred to let show() reuse the server id instead.
void DesktopNotifier::close(const QString& id)
{
    auto it = entries_.find(id);
    if (it == entries_.end())
        return;

    it->closeRequested = true;
    it->queued.reset();
    if (it->inFlight)
        return;

    QTimer::singleShot(0, this, [this, id]() {
        auto pending = entries_.find(id);
        if (pending != entries_.end() && !pending->inFlight)
            closeIfRequested(id);
    });
}

void DesktopNotifier::closeIfRequested(const QString& id)
{
    auto it = entries_.find(id);
    if (it == entries_.end() || !it->closeRequested)
        return;

    const uint serverId = it->serverId;
    entries_.erase(it);
    if (serverId != 0)
        sendClose(serverId);
}

void DesktopNotifier::sendNotify(const Notification& n, uint replacesId, NotifyReply reply)
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qWarning() << "[DesktopNotifier] Session bus not available";
        reply(0);
        return;
    }

    QVariantMap hints;
    hints["urgency"] = QVariant::fromValue(static_cast<uchar>(urgencyFor(n.category)));
    hints["category"] = QStringLiteral("device");
    if (n.category == category::TransferProgress)
        hints["transient"] = true;

    QDBusMessage msg = QDBusMessage::createMethodCall(kService, kPath, kInterface, "Notify");
    msg << kAppName
        << replacesId
        << kIcon
        << n.title
        << n.body
        << QStringList()
        << hints
        << (n.ttlMs > 0 ? n.ttlMs : -1);

    auto* watcher = new QDBusPendingCallWatcher(bus.asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, reply]() {
        QDBusPendingReply<uint> result = *watcher;
        watcher->deleteLater();
        if (result.isError()) {
            qWarning() << "[DesktopNotifier] Notify failed:" << result.error().message();
            reply(0);
            return;
        }
        reply(result.value());
    });
}

void DesktopNotifier::sendClose(uint serverId)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(kService, kPath, kInterface, "CloseNotification");
    msg << serverId;
    QDBusConnection::sessionBus().asyncCall(msg);
}

} // namespace rbridge
