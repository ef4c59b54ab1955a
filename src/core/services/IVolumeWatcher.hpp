#pragma once

#include <QObject>
#include <QString>
#include <functional>

namespace rbridge {

/// OS volume arrival/departure events and unmount requests.
/// Signals are emitted on the thread the watcher lives on.
class IVolumeWatcher : public QObject {
    Q_OBJECT
public:
    /// ok == false carries the OS's reason in the second argument.
    using EjectCallback = std::function<void(bool ok, const QString& reason)>;

    using QObject::QObject;
    ~IVolumeWatcher() override = default;

    /// Begin delivering events. Volumes already mounted are reported as arrivals.
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /// Asynchronously unmount (and power off, where supported) the volume
    /// mounted at mountPath. The callback runs exactly once.
    virtual void requestEject(const QString& mountPath, EjectCallback callback) = 0;

signals:
    void volumeMounted(const QString& displayName, const QString& mountPath);
    void volumeUnmounted(const QString& mountPath);
};

} // namespace rbridge
