#include "EventBus.hpp"
#include <QMetaObject>
#include <QList>

namespace rbridge {

EventBus::EventBus(QObject* parent) : QObject(parent) {}

int EventBus::subscribe(const QString& topic, Callback callback)
{
    Subscription sub;
    sub.prefix = topic == "*" || topic.endsWith("/*");
    sub.topic = sub.prefix ? topic.chopped(1) : topic;  // keep the trailing '/'
    sub.callback = std::move(callback);

    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    subscriptions_.insert(id, std::move(sub));
    return id;
}

void EventBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    subscriptions_.remove(subscriptionId);
}

bool EventBus::matches(const Subscription& sub, const QString& topic)
{
    return sub.prefix ? topic.startsWith(sub.topic) : topic == sub.topic;
}

void EventBus::publish(const QString& topic, const QVariant& payload)
{
    QList<Callback> targets;
    {
        QMutexLocker lock(&mutex_);
        for (auto it = subscriptions_.cbegin(); it != subscriptions_.cend(); ++it) {
            if (matches(it.value(), topic))
                targets.append(it.value().callback);
        }
    }

    for (const auto& cb : targets) {
        QMetaObject::invokeMethod(this, [cb, topic, payload]() {
            cb(topic, payload);
        }, Qt::QueuedConnection);
    }
}

} // namespace rbridge
