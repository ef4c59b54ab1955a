#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <functional>
#include <optional>

#include "NotificationService.hpp"

namespace rbridge {

/// Mirrors the active notifications onto the desktop through the
/// org.freedesktop.Notifications session-bus service. Calls are asynchronous
/// and failures are only logged.
///
/// Each stable id maps to at most one desktop bubble. While a Notify call for
/// an id is awaiting its reply, newer content for that id is held back and
/// sent as a replacement once the server id is known; a dismiss in that
/// window closes the bubble as soon as the reply arrives.
class DesktopNotifier : public QObject {
    Q_OBJECT
public:
    enum Urgency : uchar { Low = 0, Normal = 1, Critical = 2 };

    /// Receives the id the server assigned, or 0 if the call failed.
    using NotifyReply = std::function<void(uint serverId)>;

    explicit DesktopNotifier(NotificationService* source, QObject* parent = nullptr);

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    static Urgency urgencyFor(const QString& category);

protected:
    // D-Bus calls. The reply must be delivered exactly once.
    virtual void sendNotify(const Notification& n, uint replacesId, NotifyReply reply);
    virtual void sendClose(uint serverId);

private:
    struct Entry {
        uint serverId = 0;
        bool inFlight = false;
        bool closeRequested = false;
        std::optional<Notification> queued;
    };

    void show(const Notification& n);
    void close(const QString& id);
    void dispatch(const Notification& n);
    void onNotifyReply(const QString& id, uint serverId);
    void closeIfRequested(const QString& id);

    bool enabled_ = true;
    QHash<QString, Entry> entries_;
};

} // namespace rbridge
