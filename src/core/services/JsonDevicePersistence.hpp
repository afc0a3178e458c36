#pragma once

#include "IDevicePersistence.hpp"
#include <QJsonObject>
#include <QString>

namespace bdf {

/// Stores saved devices as a JSON array in a single file.
/// Writes go through QSaveFile so a crash never leaves a truncated file.
class JsonDevicePersistence : public IDevicePersistence {
public:
    explicit JsonDevicePersistence(const QString& filePath);

    QList<Device> loadSavedDevices() override;
    bool saveDevices(const QList<Device>& devices) override;

    QString filePath() const { return filePath_; }

    static QJsonObject toJson(const Device& device);
    static std::optional<Device> fromJson(const QJsonObject& obj);

private:
    QString filePath_;
};

} // namespace bdf
