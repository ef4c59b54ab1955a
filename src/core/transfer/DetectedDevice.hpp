#pragma once

#include <QMetaType>
#include <QString>

namespace rbridge {

/// One attached source volume that matched a configured device name.
struct DetectedDevice {
    QString identifier;   // stable key, the mount path
    QString displayName;  // volume label, e.g. "IC RECORDER"
    QString mountPath;    // e.g. "/media/user/IC RECORDER"

    static DetectedDevice fromVolume(const QString& displayName, const QString& mountPath)
    {
        return {mountPath, displayName, mountPath};
    }
};

} // namespace rbridge

Q_DECLARE_METATYPE(rbridge::DetectedDevice)
