#pragma once

#include "INotificationService.hpp"
#include <QObject>
#include <QList>
#include <QDateTime>
#include <QMetaType>

namespace rbridge {

struct Notification {
    QString id;
    QString category;
    QString title;
    QString body;
    int ttlMs = 0;      // 0 = persistent until dismissed
    QDateTime postedAt;
    quint64 serial = 0;
};

/// Keeps the set of active notifications, de-duplicated by id and capped at
/// maxActive (oldest dropped first). Presentation is left to whoever listens
/// to notificationAdded / notificationRemoved.
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    explicit NotificationService(int maxActive = 5, QObject* parent = nullptr);

    QString post(const QVariantMap& notification) override;
    void dismiss(const QString& notificationId) override;
    void clear();

    QList<Notification> active() const { return notifications_; }
    int maxActive() const { return maxActive_; }

signals:
    void notificationAdded(const rbridge::Notification& n);
    void notificationRemoved(const QString& id);

private:
    int indexOf(const QString& id) const;

    int maxActive_;
    quint64 nextSerial_ = 1;
    QList<Notification> notifications_;
};

} // namespace rbridge

Q_DECLARE_METATYPE(rbridge::Notification)
