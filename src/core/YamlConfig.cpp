#include "core/YamlConfig.hpp"
#include <QDir>
#include <fstream>

namespace rbridge {

// Overlay maps merge key by key into the base; scalars and sequences replace.
static YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["transfer"]["destination_folder"] = "";
    root_["transfer"]["settle_ms"] = 1000;
    root_["transfer"]["temp_patterns"] = sequence({"*.tmp", "*.partial", "*~"});

    root_["devices"]["name_patterns"] = sequence({"IC Recorder"});

    root_["notifications"]["max_active"] = 5;
    root_["notifications"]["desktop"] = true;

    root_["logging"]["level"] = "info";
    root_["logging"]["file"] = "";
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults;
    initDefaults();
    defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QStringList YamlConfig::stringList(const YAML::Node& node) const
{
    QStringList result;
    if (node.IsSequence()) {
        for (const auto& item : node)
            result.append(QString::fromStdString(item.as<std::string>()));
    } else if (node.IsScalar()) {
        // Single comma-separated string, as older configs stored it
        for (const auto& part : QString::fromStdString(node.Scalar()).split(','))
            result.append(part);
    }
    for (auto& s : result)
        s = s.trimmed();
    result.removeAll(QString());
    return result;
}

YAML::Node YamlConfig::sequence(const QStringList& values)
{
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& v : values)
        node.push_back(v.toStdString());
    return node;
}

// --- Transfer ---

QString YamlConfig::destinationFolder() const
{
    QString path = QString::fromStdString(
        root_["transfer"]["destination_folder"].as<std::string>("")).trimmed();
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

void YamlConfig::setDestinationFolder(const QString& v)
{
    root_["transfer"]["destination_folder"] = v.toStdString();
}

int YamlConfig::settleMs() const
{
    return root_["transfer"]["settle_ms"].as<int>(1000);
}

void YamlConfig::setSettleMs(int v)
{
    root_["transfer"]["settle_ms"] = v;
}

QStringList YamlConfig::tempPatterns() const
{
    return stringList(root_["transfer"]["temp_patterns"]);
}

void YamlConfig::setTempPatterns(const QStringList& patterns)
{
    root_["transfer"]["temp_patterns"] = sequence(patterns);
}

// --- Devices ---

QStringList YamlConfig::deviceNamePatterns() const
{
    return stringList(root_["devices"]["name_patterns"]);
}

void YamlConfig::setDeviceNamePatterns(const QStringList& patterns)
{
    root_["devices"]["name_patterns"] = sequence(patterns);
}

// --- Notifications ---

int YamlConfig::maxActiveNotifications() const
{
    return root_["notifications"]["max_active"].as<int>(5);
}

void YamlConfig::setMaxActiveNotifications(int v)
{
    root_["notifications"]["max_active"] = v;
}

bool YamlConfig::desktopNotifications() const
{
    return root_["notifications"]["desktop"].as<bool>(true);
}

void YamlConfig::setDesktopNotifications(bool v)
{
    root_["notifications"]["desktop"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

QString YamlConfig::logFile() const
{
    return QString::fromStdString(root_["logging"]["file"].as<std::string>(""));
}

void YamlConfig::setLogFile(const QString& v)
{
    root_["logging"]["file"] = v.toStdString();
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = QString::fromStdString(s).toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    QStringList parts = dottedKey.split('.');

    // Path must exist in the defaults tree and resolve to a scalar leaf
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace rbridge
