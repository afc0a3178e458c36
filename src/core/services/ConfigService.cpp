#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace bdf {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

void ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (!config_->setValueByPath(key, val)) {
        BOOST_LOG_TRIVIAL(warning) << "[ConfigService] Rejected write to unknown key '"
                                   << key.toStdString() << "'";
        return;
    }
    emit configChanged(key, config_->valueByPath(key));
}

void ConfigService::save()
{
    if (configPath_.isEmpty())
        return;
    QDir().mkpath(QFileInfo(configPath_).absolutePath());
    config_->save(configPath_);
}

} // namespace bdf
