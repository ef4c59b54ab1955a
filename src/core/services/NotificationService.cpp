#include "NotificationService.hpp"
#include <QTimer>
#include <QUuid>
#include <QDebug>

namespace rbridge {

NotificationService::NotificationService(int maxActive, QObject* parent)
    : QObject(parent), maxActive_(qMax(1, maxActive))
{
}

int NotificationService::indexOf(const QString& id) const
{
    for (int i = 0; i < notifications_.size(); ++i) {
        if (notifications_[i].id == id)
            return i;
    }
    return -1;
}

QString NotificationService::post(const QVariantMap& data)
{
    Notification n;
    n.id = data.value("id").toString();
    if (n.id.isEmpty())
        n.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    n.category = data.value("category").toString();
    n.title = data.value("title").toString();
    n.body = data.value("body").toString();
    n.ttlMs = data.value("ttlMs", 0).toInt();
    n.postedAt = QDateTime::currentDateTimeUtc();
    n.serial = nextSerial_++;

    // Same stable id replaces the earlier one
    int existing = indexOf(n.id);
    if (existing >= 0) {
        notifications_.removeAt(existing);
        emit notificationRemoved(n.id);
    }

    while (notifications_.size() >= maxActive_) {
        QString dropped = notifications_.takeFirst().id;
        emit notificationRemoved(dropped);
    }

    notifications_.append(n);
    qDebug() << "[Notifications]" << n.category << "-" << n.title << ":" << n.body;
    emit notificationAdded(n);

    if (n.ttlMs > 0) {
        QString id = n.id;
        quint64 serial = n.serial;
        QTimer::singleShot(n.ttlMs, this, [this, id, serial]() {
            // Skip if the id was re-posted since
            int idx = indexOf(id);
            if (idx >= 0 && notifications_[idx].serial == serial)
                dismiss(id);
        });
    }

    return n.id;
}

void NotificationService::dismiss(const QString& notificationId)
{
    int idx = indexOf(notificationId);
    if (idx < 0)
        return;
    notifications_.removeAt(idx);
    emit notificationRemoved(notificationId);
}

void NotificationService::clear()
{
    while (!notifications_.isEmpty()) {
        QString id = notifications_.takeFirst().id;
        emit notificationRemoved(id);
    }
}

} // namespace rbridge
