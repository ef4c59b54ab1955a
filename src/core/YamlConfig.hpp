#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace rbridge {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the built-in defaults.
    /// Throws YAML::Exception on unreadable or malformed files.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Transfer
    /// Inbox folder with a leading "~" expanded. Empty when not configured.
    QString destinationFolder() const;
    void setDestinationFolder(const QString& v);
    int settleMs() const;
    void setSettleMs(int v);
    QStringList tempPatterns() const;
    void setTempPatterns(const QStringList& patterns);

    // Devices
    QStringList deviceNamePatterns() const;
    void setDeviceNamePatterns(const QStringList& patterns);

    // Notifications
    int maxActiveNotifications() const;
    void setMaxActiveNotifications(int v);
    bool desktopNotifications() const;
    void setDesktopNotifications(bool v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);
    QString logFile() const;
    void setLogFile(const QString& v);

    // Generic dot-path access for scalar leaves (e.g. "transfer.settle_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
    QStringList stringList(const YAML::Node& node) const;
    static YAML::Node sequence(const QStringList& values);
};

} // namespace rbridge
