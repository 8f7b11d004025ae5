#include "taskvault/data/Settings.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"

#include <QJsonValue>
#include <QStringList>

#include <cmath>
#include <limits>

namespace taskvault {
namespace data {

namespace {
constexpr auto TIME_FORMAT = "HH:mm";

constexpr int kMaxThemeLength = 50;

const QStringList &knownChannels()
{
    static const QStringList channels{QStringLiteral("stable"), QStringLiteral("beta")};
    return channels;
}

QString requireString(const QJsonValue &value, const QString &field)
{
    if (!value.isString()) {
        throw core::ValidationError(field, QStringLiteral("must be a string"));
    }
    return value.toString();
}

int requireInt(const QJsonValue &value, const QString &field)
{
    const double number = value.toDouble(std::nan(""));
    if (!value.isDouble() || std::floor(number) != number) {
        throw core::ValidationError(field, QStringLiteral("must be an integer"));
    }
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        throw core::ValidationError(field, QStringLiteral("is out of range"));
    }
    return static_cast<int>(number);
}

bool requireBool(const QJsonValue &value, const QString &field)
{
    if (!value.isBool()) {
        throw core::ValidationError(field, QStringLiteral("must be a boolean"));
    }
    return value.toBool();
}

QTime requireTime(const QJsonValue &value, const QString &field)
{
    const QTime time = QTime::fromString(requireString(value, field), QLatin1String(TIME_FORMAT));
    if (!time.isValid()) {
        throw core::ValidationError(field, QStringLiteral("must be HH:mm"));
    }
    return time;
}

QJsonValue optionalDateTime(const QDateTime &dt)
{
    return dt.isValid() ? QJsonValue(dt.toString(Qt::ISODate)) : QJsonValue(QJsonValue::Null);
}
} // namespace

bool SettingsPatch::isEmpty() const
{
    return !theme && !displayScale && !autosaveIntervalSeconds && !dailyResetTime && !autostart
        && !notifications && !updateChannel && !updateAutoCheck;
}

SettingsPatch SettingsPatch::fromJson(const QJsonObject &object)
{
    SettingsPatch patch;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        const QString &key = it.key();
        const QJsonValue value = it.value();
        if (key == QLatin1String("theme")) {
            patch.theme = requireString(value, key);
        } else if (key == QLatin1String("display_scale")) {
            patch.displayScale = requireInt(value, key);
        } else if (key == QLatin1String("autosave_interval")) {
            patch.autosaveIntervalSeconds = requireInt(value, key);
        } else if (key == QLatin1String("daily_reset_time")) {
            patch.dailyResetTime = requireTime(value, key);
        } else if (key == QLatin1String("autostart")) {
            patch.autostart = requireBool(value, key);
        } else if (key == QLatin1String("notifications")) {
            patch.notifications = requireBool(value, key);
        } else if (key == QLatin1String("updates")) {
            if (!value.isObject()) {
                throw core::ValidationError(key, QStringLiteral("must be an object"));
            }
            const QJsonObject updates = value.toObject();
            for (auto u = updates.constBegin(); u != updates.constEnd(); ++u) {
                const QString field = QStringLiteral("updates.") + u.key();
                if (u.key() == QLatin1String("channel")) {
                    patch.updateChannel = requireString(u.value(), field);
                } else if (u.key() == QLatin1String("auto_check")) {
                    patch.updateAutoCheck = requireBool(u.value(), field);
                } else {
                    throw core::ValidationError(field, QStringLiteral("unknown field"));
                }
            }
        } else if (key == QLatin1String("last_daily_reset") || key == QLatin1String("last_automatic_backup")) {
            throw core::ValidationError(key, QStringLiteral("field is read-only"));
        } else {
            throw core::ValidationError(key, QStringLiteral("unknown field"));
        }
    }
    return patch;
}

void validateSettings(const Settings &settings)
{
    if (settings.theme.trimmed().isEmpty() || settings.theme.size() > kMaxThemeLength) {
        throw core::ValidationError(QStringLiteral("theme"),
                                    QStringLiteral("must be 1-%1 characters").arg(kMaxThemeLength));
    }
    if (settings.displayScale < Settings::kMinScale || settings.displayScale > Settings::kMaxScale) {
        throw core::ValidationError(QStringLiteral("display_scale"),
                                    QStringLiteral("must be between %1 and %2")
                                        .arg(Settings::kMinScale)
                                        .arg(Settings::kMaxScale));
    }
    if (settings.autosaveIntervalSeconds < Settings::kMinAutosaveSeconds
        || settings.autosaveIntervalSeconds > Settings::kMaxAutosaveSeconds) {
        throw core::ValidationError(QStringLiteral("autosave_interval"),
                                    QStringLiteral("must be between %1 and %2 seconds")
                                        .arg(Settings::kMinAutosaveSeconds)
                                        .arg(Settings::kMaxAutosaveSeconds));
    }
    if (!settings.dailyResetTime.isValid()) {
        throw core::ValidationError(QStringLiteral("daily_reset_time"), QStringLiteral("must be HH:mm"));
    }
    if (!knownChannels().contains(settings.updates.channel)) {
        throw core::ValidationError(QStringLiteral("updates.channel"), QStringLiteral("must be stable or beta"));
    }
}

Settings applyPatch(Settings settings, const SettingsPatch &patch)
{
    if (patch.theme) {
        settings.theme = *patch.theme;
    }
    if (patch.displayScale) {
        settings.displayScale = *patch.displayScale;
    }
    if (patch.autosaveIntervalSeconds) {
        settings.autosaveIntervalSeconds = *patch.autosaveIntervalSeconds;
    }
    if (patch.dailyResetTime) {
        settings.dailyResetTime = *patch.dailyResetTime;
    }
    if (patch.autostart) {
        settings.autostart = *patch.autostart;
    }
    if (patch.notifications) {
        settings.notifications = *patch.notifications;
    }
    if (patch.updateChannel) {
        settings.updates.channel = *patch.updateChannel;
    }
    if (patch.updateAutoCheck) {
        settings.updates.autoCheck = *patch.updateAutoCheck;
    }
    return settings;
}

QJsonObject settingsToJson(const Settings &settings)
{
    QJsonObject updates;
    updates.insert(QStringLiteral("channel"), settings.updates.channel);
    updates.insert(QStringLiteral("auto_check"), settings.updates.autoCheck);

    QJsonObject object;
    object.insert(QStringLiteral("theme"), settings.theme);
    object.insert(QStringLiteral("display_scale"), settings.displayScale);
    object.insert(QStringLiteral("autosave_interval"), settings.autosaveIntervalSeconds);
    object.insert(QStringLiteral("daily_reset_time"), settings.dailyResetTime.toString(QLatin1String(TIME_FORMAT)));
    object.insert(QStringLiteral("autostart"), settings.autostart);
    object.insert(QStringLiteral("notifications"), settings.notifications);
    object.insert(QStringLiteral("updates"), updates);
    object.insert(QStringLiteral("last_daily_reset"), optionalDateTime(settings.lastDailyReset));
    object.insert(QStringLiteral("last_automatic_backup"), optionalDateTime(settings.lastAutomaticBackup));
    return object;
}

Settings settingsFromJson(const QJsonObject &object)
{
    Settings defaults;
    Settings settings;
    settings.theme = object.value(QStringLiteral("theme")).toString(defaults.theme);
    settings.displayScale = object.value(QStringLiteral("display_scale")).toInt(defaults.displayScale);
    settings.autosaveIntervalSeconds
        = object.value(QStringLiteral("autosave_interval")).toInt(defaults.autosaveIntervalSeconds);
    const QTime resetTime = QTime::fromString(object.value(QStringLiteral("daily_reset_time")).toString(),
                                              QLatin1String(TIME_FORMAT));
    settings.dailyResetTime = resetTime.isValid() ? resetTime : defaults.dailyResetTime;
    settings.autostart = object.value(QStringLiteral("autostart")).toBool(defaults.autostart);
    settings.notifications = object.value(QStringLiteral("notifications")).toBool(defaults.notifications);
    const QJsonObject updates = object.value(QStringLiteral("updates")).toObject();
    settings.updates.channel = updates.value(QStringLiteral("channel")).toString(defaults.updates.channel);
    settings.updates.autoCheck = updates.value(QStringLiteral("auto_check")).toBool(defaults.updates.autoCheck);
    settings.lastDailyReset
        = QDateTime::fromString(object.value(QStringLiteral("last_daily_reset")).toString(), Qt::ISODate);
    settings.lastAutomaticBackup
        = QDateTime::fromString(object.value(QStringLiteral("last_automatic_backup")).toString(), Qt::ISODate);

    try {
        validateSettings(settings);
    } catch (const core::ValidationError &error) {
        qCWarning(core::lcData) << "stored settings invalid, using defaults:" << error.message();
        defaults.lastDailyReset = settings.lastDailyReset;
        defaults.lastAutomaticBackup = settings.lastAutomaticBackup;
        return defaults;
    }
    return settings;
}

} // namespace data
} // namespace taskvault
