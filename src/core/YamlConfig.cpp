#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace bdf {

namespace {

// Overlays the user file onto the defaults tree. Maps recurse; scalars and
// sequences from the overlay replace the default. Keys the defaults do not
// define are dropped so the schema stays closed.
YAML::Node overlayDefaults(const YAML::Node& defaults, const YAML::Node& overlay,
                           const std::string& path)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);

    if (!defaults.IsMap())
        return YAML::Clone(overlay);

    if (!overlay.IsMap()) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Expected a mapping at '" << path
                                   << "', keeping defaults";
        return YAML::Clone(defaults);
    }

    YAML::Node result = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const std::string childPath = path.empty() ? key : path + "." + key;
        if (!result[key]) {
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Ignoring unknown key '" << childPath << "'";
            continue;
        }
        result[key] = overlayDefaults(result[key], it->second, childPath);
    }
    return result;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["radio"]["backend"] = "auto";
    root_["radio"]["adapter"] = "";

    root_["scan"]["duration_ms"] = 30000;
    root_["scan"]["warmup_ms"] = 10000;
    root_["scan"]["narrow_after_warmup"] = true;
    root_["scan"]["include_unnamed"] = true;
    root_["scan"]["service_filter"] = YAML::Node(YAML::NodeType::Sequence);
    root_["scan"]["service_filter"].push_back("180f");   // battery
    root_["scan"]["service_filter"].push_back("1802");   // immediate alert
    root_["scan"]["service_filter"].push_back("180a");   // device information
    root_["scan"]["service_filter"].push_back("1812");   // HID
    root_["scan"]["service_filter"].push_back("110b");   // audio sink
    root_["scan"]["service_filter"].push_back("fe2c");   // fast pair

    root_["connection"]["timeout_ms"] = 12000;
    root_["connection"]["max_service_discovery_attempts"] = 3;
    root_["connection"]["service_discovery_retry_ms"] = 1000;
    root_["connection"]["rssi_refresh_ms"] = 2000;
    root_["connection"]["auto_connect_saved"] = false;

    root_["proximity"]["reference_power"] = -59;
    root_["proximity"]["path_loss_exponent"] = 2.5;
    root_["proximity"]["fallback_distance_m"] = 30.0;

    root_["synthetic"]["stagger_ms"] = 1500;
    root_["synthetic"]["update_interval_ms"] = 2000;
    root_["synthetic"]["update_cycles"] = 5;
    root_["synthetic"]["jitter_db"] = 4;
    root_["synthetic"]["connect_delay_ms"] = 800;

    root_["location"]["source"] = "none";
    root_["location"]["latitude"] = 0.0;
    root_["location"]["longitude"] = 0.0;

    root_["persistence"]["saved_devices_path"] = "";

    root_["notifications"]["ttl_ms"] = 8000;

    root_["logging"]["level"] = "info";
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node defaults;
    initDefaults();
    defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = overlayDefaults(defaults, loaded, std::string());
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Radio ---

QString YamlConfig::radioBackend() const
{
    return QString::fromStdString(root_["radio"]["backend"].as<std::string>("auto"));
}

void YamlConfig::setRadioBackend(const QString& v)
{
    root_["radio"]["backend"] = v.toStdString();
}

QString YamlConfig::radioAdapter() const
{
    return QString::fromStdString(root_["radio"]["adapter"].as<std::string>(""));
}

void YamlConfig::setRadioAdapter(const QString& v)
{
    root_["radio"]["adapter"] = v.toStdString();
}

// --- Scan ---

int YamlConfig::scanDurationMs() const
{
    return root_["scan"]["duration_ms"].as<int>(30000);
}

void YamlConfig::setScanDurationMs(int v)
{
    root_["scan"]["duration_ms"] = v;
}

int YamlConfig::scanWarmupMs() const
{
    return root_["scan"]["warmup_ms"].as<int>(10000);
}

void YamlConfig::setScanWarmupMs(int v)
{
    root_["scan"]["warmup_ms"] = v;
}

bool YamlConfig::scanNarrowAfterWarmup() const
{
    return root_["scan"]["narrow_after_warmup"].as<bool>(true);
}

void YamlConfig::setScanNarrowAfterWarmup(bool v)
{
    root_["scan"]["narrow_after_warmup"] = v;
}

bool YamlConfig::scanIncludeUnnamed() const
{
    return root_["scan"]["include_unnamed"].as<bool>(true);
}

void YamlConfig::setScanIncludeUnnamed(bool v)
{
    root_["scan"]["include_unnamed"] = v;
}

QStringList YamlConfig::scanServiceFilter() const
{
    QStringList result;
    YAML::Node list = root_["scan"]["service_filter"];
    if (!list.IsSequence())
        return result;
    for (const auto& entry : list)
        result.append(QString::fromStdString(entry.as<std::string>("")));
    return result;
}

void YamlConfig::setScanServiceFilter(const QStringList& uuids)
{
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto& uuid : uuids)
        list.push_back(uuid.toStdString());
    root_["scan"]["service_filter"] = list;
}

// --- Connection ---

int YamlConfig::connectTimeoutMs() const
{
    return root_["connection"]["timeout_ms"].as<int>(12000);
}

void YamlConfig::setConnectTimeoutMs(int v)
{
    root_["connection"]["timeout_ms"] = v;
}

int YamlConfig::maxServiceDiscoveryAttempts() const
{
    return root_["connection"]["max_service_discovery_attempts"].as<int>(3);
}

void YamlConfig::setMaxServiceDiscoveryAttempts(int v)
{
    root_["connection"]["max_service_discovery_attempts"] = v;
}

int YamlConfig::rssiRefreshMs() const
{
    return root_["connection"]["rssi_refresh_ms"].as<int>(2000);
}

void YamlConfig::setRssiRefreshMs(int v)
{
    root_["connection"]["rssi_refresh_ms"] = v;
}

bool YamlConfig::autoConnectSaved() const
{
    return root_["connection"]["auto_connect_saved"].as<bool>(false);
}

void YamlConfig::setAutoConnectSaved(bool v)
{
    root_["connection"]["auto_connect_saved"] = v;
}

// --- Proximity ---

int YamlConfig::referencePower() const
{
    return root_["proximity"]["reference_power"].as<int>(-59);
}

void YamlConfig::setReferencePower(int v)
{
    root_["proximity"]["reference_power"] = v;
}

double YamlConfig::pathLossExponent() const
{
    return root_["proximity"]["path_loss_exponent"].as<double>(2.5);
}

void YamlConfig::setPathLossExponent(double v)
{
    root_["proximity"]["path_loss_exponent"] = v;
}

double YamlConfig::fallbackDistance() const
{
    return root_["proximity"]["fallback_distance_m"].as<double>(30.0);
}

void YamlConfig::setFallbackDistance(double v)
{
    root_["proximity"]["fallback_distance_m"] = v;
}

// --- Location ---

QString YamlConfig::locationSource() const
{
    return QString::fromStdString(root_["location"]["source"].as<std::string>("none"));
}

void YamlConfig::setLocationSource(const QString& v)
{
    root_["location"]["source"] = v.toStdString();
}

// --- Persistence ---

QString YamlConfig::savedDevicesPath() const
{
    return QString::fromStdString(root_["persistence"]["saved_devices_path"].as<std::string>(""));
}

void YamlConfig::setSavedDevicesPath(const QString& v)
{
    root_["persistence"]["saved_devices_path"] = v.toStdString();
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

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (node.IsSequence()) {
        QStringList items;
        for (const auto& entry : node) {
            if (entry.IsScalar())
                items.append(QString::fromStdString(entry.Scalar()));
        }
        return QVariant(items);
    }

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

    // Path must exist in the defaults tree and resolve to a leaf (scalar or list of scalars)
    bool isList = false;
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (defaults.IsSequence())
            isList = true;
        else if (!defaults.IsScalar())
            return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    std::string leafKey = parts.last().toStdString();
    if (isList) {
        YAML::Node list(YAML::NodeType::Sequence);
        for (const auto& item : value.toStringList())
            list.push_back(item.toStdString());
        node[leafKey] = list;
        return true;
    }

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

} // namespace bdf
