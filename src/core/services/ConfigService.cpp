#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace rbridge {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    // List-valued and path-valued keys go through the typed accessors
    if (key == "transfer.destination_folder") return config_->destinationFolder();
    if (key == "transfer.temp_patterns") return config_->tempPatterns();
    if (key == "devices.name_patterns") return config_->deviceNamePatterns();
    return config_->valueByPath(key);
}

void ConfigService::setValue(const QString& key, const QVariant& val)
{
    bool applied = true;
    if (key == "transfer.temp_patterns")
        config_->setTempPatterns(val.toStringList());
    else if (key == "devices.name_patterns")
        config_->setDeviceNamePatterns(val.toStringList());
    else
        applied = config_->setValueByPath(key, val);

    if (!applied) {
        qWarning() << "[ConfigService] Ignoring unknown key" << key;
        return;
    }
    emit configChanged(key, val);
}

void ConfigService::save()
{
    QDir().mkpath(QFileInfo(configPath_).absolutePath());
    config_->save(configPath_);
}

} // namespace rbridge
