#pragma once

#include <QVariantMap>
#include <QString>

namespace rbridge {

namespace category {
inline constexpr char DeviceConnected[] = "device-connected";
inline constexpr char DeviceDisconnected[] = "device-disconnected";
inline constexpr char ScanStarted[] = "scan-started";
inline constexpr char ScanCompleted[] = "scan-completed";
inline constexpr char ScanFailed[] = "scan-failed";
inline constexpr char TransferStarted[] = "transfer-started";
inline constexpr char TransferProgress[] = "transfer-progress";
inline constexpr char TransferCompleted[] = "transfer-completed";
inline constexpr char TransferFailed[] = "transfer-failed";
inline constexpr char EjectCompleted[] = "eject-completed";
inline constexpr char EjectFailed[] = "eject-failed";
} // namespace category

/// Sink for user-facing lifecycle notifications.
/// Delivery is fire-and-forget: callers never wait for presentation and must
/// not assume every posted notification is shown.
class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Post a notification. Required fields: category, title, body.
    /// Optional: id (stable de-duplication key; posting an active id replaces
    /// it), ttlMs (0 = persistent until dismissed).
    /// Returns the notification ID.
    virtual QString post(const QVariantMap& notification) = 0;

    /// Dismiss a notification by ID.
    virtual void dismiss(const QString& notificationId) = 0;
};

} // namespace rbridge
