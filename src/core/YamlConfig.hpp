#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace bdf {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the built-in defaults.
    /// Throws YAML::Exception if the file cannot be read or parsed.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Radio
    QString radioBackend() const;
    void setRadioBackend(const QString& v);
    QString radioAdapter() const;
    void setRadioAdapter(const QString& v);

    // Scan
    int scanDurationMs() const;
    void setScanDurationMs(int v);
    int scanWarmupMs() const;
    void setScanWarmupMs(int v);
    bool scanNarrowAfterWarmup() const;
    void setScanNarrowAfterWarmup(bool v);
    bool scanIncludeUnnamed() const;
    void setScanIncludeUnnamed(bool v);
    QStringList scanServiceFilter() const;
    void setScanServiceFilter(const QStringList& uuids);

    // Connection
    int connectTimeoutMs() const;
    void setConnectTimeoutMs(int v);
    int maxServiceDiscoveryAttempts() const;
    void setMaxServiceDiscoveryAttempts(int v);
    int rssiRefreshMs() const;
    void setRssiRefreshMs(int v);
    bool autoConnectSaved() const;
    void setAutoConnectSaved(bool v);

    // Proximity calibration
    int referencePower() const;
    void setReferencePower(int v);
    double pathLossExponent() const;
    void setPathLossExponent(double v);
    double fallbackDistance() const;
    void setFallbackDistance(double v);

    // Location
    QString locationSource() const;
    void setLocationSource(const QString& v);

    // Persistence
    QString savedDevicesPath() const;
    void setSavedDevicesPath(const QString& v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Generic dot-path access (e.g. "connection.timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace bdf
