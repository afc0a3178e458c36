#pragma once

#include <QString>
#include <QVariant>

namespace bdf {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "connection.timeout_ms").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Keys outside the defaults schema are rejected.
    /// Must be called from the main thread (single-writer rule).
    virtual void setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    /// Must be called from the main thread.
    virtual void save() = 0;
};

/// Typed reads with a fallback for missing or mistyped keys.
inline int configInt(const IConfigService* config, const QString& key, int fallback)
{
    if (!config) return fallback;
    bool ok = false;
    int v = config->value(key).toInt(&ok);
    return ok ? v : fallback;
}

inline double configDouble(const IConfigService* config, const QString& key, double fallback)
{
    if (!config) return fallback;
    bool ok = false;
    double v = config->value(key).toDouble(&ok);
    return ok ? v : fallback;
}

inline bool configBool(const IConfigService* config, const QString& key, bool fallback)
{
    if (!config) return fallback;
    QVariant v = config->value(key);
    return v.isValid() ? v.toBool() : fallback;
}

} // namespace bdf
