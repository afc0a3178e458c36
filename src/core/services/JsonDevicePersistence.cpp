#include "JsonDevicePersistence.hpp"
#include "core/devices/ProximityEstimator.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace bdf {

JsonDevicePersistence::JsonDevicePersistence(const QString& filePath)
    : filePath_(filePath)
{
}

QJsonObject JsonDevicePersistence::toJson(const Device& device)
{
    QJsonObject obj;
    obj["id"] = device.id;
    obj["name"] = device.name;
    obj["category"] = toString(device.category);
    obj["saved"] = device.isSaved;
    if (device.lastSeen.isValid())
        obj["lastSeen"] = device.lastSeen.toString(Qt::ISODateWithMs);
    if (device.batteryLevel)
        obj["battery"] = *device.batteryLevel;
    if (device.location) {
        QJsonObject loc;
        loc["latitude"] = device.location->latitude;
        loc["longitude"] = device.location->longitude;
        loc["timestamp"] = device.location->timestamp.toString(Qt::ISODateWithMs);
        obj["location"] = loc;
    }
    if (!device.manufacturerName.isEmpty())
        obj["manufacturer"] = device.manufacturerName;
    if (!device.modelNumber.isEmpty())
        obj["model"] = device.modelNumber;
    return obj;
}

std::optional<Device> JsonDevicePersistence::fromJson(const QJsonObject& obj)
{
    const QString id = obj.value("id").toString();
    if (id.isEmpty())
        return std::nullopt;

    Device d;
    d.id = id;
    d.name = obj.value("name").toString();
    d.category = categoryFromString(obj.value("category").toString());
    d.isSaved = obj.value("saved").toBool(true);
    d.lastSeen = QDateTime::fromString(obj.value("lastSeen").toString(), Qt::ISODateWithMs);
    if (obj.contains("battery"))
        d.batteryLevel = qBound(0, obj.value("battery").toInt(), 100);
    if (obj.value("location").isObject()) {
        const QJsonObject loc = obj.value("location").toObject();
        Coordinate c;
        c.latitude = loc.value("latitude").toDouble();
        c.longitude = loc.value("longitude").toDouble();
        c.timestamp = QDateTime::fromString(loc.value("timestamp").toString(), Qt::ISODateWithMs);
        d.location = c;
    }
    d.manufacturerName = obj.value("manufacturer").toString();
    d.modelNumber = obj.value("model").toString();
    d.estimatedDistance = proximity::estimateDistance(std::nullopt, proximity::Calibration{});
    return d;
}

QList<Device> JsonDevicePersistence::loadSavedDevices()
{
    QList<Device> result;
    QFile file(filePath_);
    if (!file.exists())
        return result;
    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[JsonDevicePersistence] Cannot open " << filePath_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return result;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        BOOST_LOG_TRIVIAL(warning) << "[JsonDevicePersistence] Ignoring malformed "
                                   << filePath_.toStdString() << ": " << err.errorString().toStdString();
        return result;
    }

    for (const auto& entry : doc.array()) {
        if (auto device = fromJson(entry.toObject()))
            result.append(*device);
    }
    BOOST_LOG_TRIVIAL(info) << "[JsonDevicePersistence] Loaded " << result.size() << " saved device(s)";
    return result;
}

bool JsonDevicePersistence::saveDevices(const QList<Device>& devices)
{
    QJsonArray arr;
    for (const auto& device : devices)
        arr.append(toJson(device));

    QDir().mkpath(QFileInfo(filePath_).absolutePath());
    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(error) << "[JsonDevicePersistence] Cannot write " << filePath_.toStdString()
                                 << ": " << file.errorString().toStdString();
        return false;
    }
    file.write(QJsonDocument(arr).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(error) << "[JsonDevicePersistence] Commit failed for " << filePath_.toStdString()
                                 << ": " << file.errorString().toStdString();
        return false;
    }
    return true;
}

} // namespace bdf
