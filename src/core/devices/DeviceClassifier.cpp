#include "core/devices/DeviceClassifier.hpp"
#include "core/ble/GattUuids.hpp"
#include <QStringList>

namespace bdf {

namespace {

struct KeywordRule {
    DeviceCategory category;
    QStringList keywords;
};

// Order matters: "headphones" contains "phone", "imac" contains "mac".
const std::vector<KeywordRule>& keywordRules()
{
    static const std::vector<KeywordRule> rules = {
        {DeviceCategory::Headphones, {"headphone", "earbud", "airpod", "headset", "earphone", "buds"}},
        {DeviceCategory::Speaker,    {"speaker", "soundbar", "boombox", "sound", "audio"}},
        {DeviceCategory::Watch,      {"watch", "fitbit"}},
        {DeviceCategory::Keyboard,   {"keyboard"}},
        {DeviceCategory::Mouse,      {"mouse", "trackpad"}},
        {DeviceCategory::Phone,      {"phone", "pixel"}},
        {DeviceCategory::Tablet,     {"ipad", "tablet"}},
        {DeviceCategory::Computer,   {"imac", "mac mini", "mac studio", "mac pro"}},
        {DeviceCategory::Laptop,     {"laptop", "book", "mac"}},
        {DeviceCategory::Computer,   {"computer", "desktop"}},
    };
    return rules;
}

std::optional<DeviceCategory> matchKeywords(const QString& name)
{
    const QString lower = name.toLower();
    if (lower.isEmpty())
        return std::nullopt;

    for (const auto& rule : keywordRules()) {
        for (const auto& keyword : rule.keywords) {
            if (lower.contains(keyword))
                return rule.category;
        }
    }
    return std::nullopt;
}

QString effectiveName(const AdvertisementData& data, const QString& name)
{
    return name.isEmpty() ? data.localName : name;
}

bool advertises(const AdvertisementData& data, const QBluetoothUuid& uuid)
{
    return data.serviceUuids.contains(uuid) || data.serviceData.contains(uuid);
}

} // namespace

DeviceClassifier::DeviceClassifier()
    : stages_{
          {QStringLiteral("service-uuids"), &DeviceClassifier::matchServiceUuids},
          {QStringLiteral("manufacturer-data"), &DeviceClassifier::matchManufacturerData},
          {QStringLiteral("name-keywords"), &DeviceClassifier::matchNameKeywords},
      }
{
}

DeviceClassifier::DeviceClassifier(std::vector<Stage> stages)
    : stages_(std::move(stages))
{
}

DeviceCategory DeviceClassifier::classify(const AdvertisementData& data, const QString& name) const
{
    for (const auto& stage : stages_) {
        if (!stage.match)
            continue;
        if (auto category = stage.match(data, name))
            return *category;
    }
    return DeviceCategory::Unknown;
}

std::optional<DeviceCategory> DeviceClassifier::matchServiceUuids(const AdvertisementData& data,
                                                                  const QString& name)
{
    using namespace ble;

    if (advertises(data, gatt::audioSink()) || advertises(data, gatt::audioSource())
        || advertises(data, gatt::remoteControl()) || advertises(data, gatt::remoteControlTarget())
        || advertises(data, gatt::googleFastPair()))
        return DeviceCategory::Headphones;

    if (advertises(data, gatt::humanInterfaceService())) {
        const QString lower = effectiveName(data, name).toLower();
        if (lower.contains(QLatin1String("mouse")) || lower.contains(QLatin1String("trackpad")))
            return DeviceCategory::Mouse;
        return DeviceCategory::Keyboard;
    }

    if (advertises(data, gatt::heartRateService()) || advertises(data, gatt::currentTimeService()))
        return DeviceCategory::Watch;

    return std::nullopt;
}

std::optional<DeviceCategory> DeviceClassifier::matchManufacturerData(const AdvertisementData& data,
                                                                      const QString& name)
{
    if (!data.manufacturerData.contains(ble::gatt::kAppleCompanyId))
        return std::nullopt;

    const QString lower = effectiveName(data, name).toLower();
    if (lower.contains(QLatin1String("airpod")) || lower.contains(QLatin1String("beats")))
        return DeviceCategory::Headphones;
    if (lower.contains(QLatin1String("watch")))
        return DeviceCategory::Watch;
    if (lower.contains(QLatin1String("ipad")))
        return DeviceCategory::Tablet;
    if (lower.contains(QLatin1String("imac")))
        return DeviceCategory::Computer;
    if (lower.contains(QLatin1String("mac")) || lower.contains(QLatin1String("book")))
        return DeviceCategory::Laptop;

    // Unnamed Apple advertisements are overwhelmingly phones.
    return DeviceCategory::Phone;
}

std::optional<DeviceCategory> DeviceClassifier::matchNameKeywords(const AdvertisementData& data,
                                                                  const QString& name)
{
    if (auto category = matchKeywords(name))
        return category;
    if (data.localName != name)
        return matchKeywords(data.localName);
    return std::nullopt;
}

} // namespace bdf
