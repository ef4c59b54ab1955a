#pragma once

#include <QString>
#include <QVariant>

namespace rbridge {

/// Read/write access to the settings store.
/// Pipeline components read values fresh at the start of every scan or
/// transfer cycle and never cache them.
class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "transfer.destination_folder").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value.
    /// Must be called from the main thread (single-writer rule).
    virtual void setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    virtual void save() = 0;
};

} // namespace rbridge
