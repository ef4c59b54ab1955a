#pragma once

#include <QString>
#include <QVariant>
#include <functional>

namespace rbridge {

/// Topic-keyed publish/subscribe channel for pipeline lifecycle events.
/// Topics look like "device/connected" or "transfer/progress".
/// Subscribers are invoked on the thread the bus lives on (Qt::QueuedConnection).
class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Callback = std::function<void(const QString& topic, const QVariant& payload)>;

    /// Subscribe to a topic, or to a whole family with a trailing "/*"
    /// (e.g. "scan/*"); "*" alone receives everything. Returns a subscription ID for unsubscribe.
    /// Thread-safe.
    virtual int subscribe(const QString& topic, Callback callback) = 0;

    /// Thread-safe.
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Publish an event. Matching subscribers are invoked asynchronously.
    /// Thread-safe (can be called from any thread).
    virtual void publish(const QString& topic, const QVariant& payload = {}) = 0;
};

} // namespace rbridge
