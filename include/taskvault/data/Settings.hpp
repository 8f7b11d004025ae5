#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QTime>

#include <optional>

namespace taskvault {
namespace data {

struct UpdateConfig
{
    QString channel = QStringLiteral("stable");
    bool autoCheck = true;
};

struct Settings
{
    static constexpr int kMinScale = 50;
    static constexpr int kMaxScale = 200;
    static constexpr int kMinAutosaveSeconds = 5;
    static constexpr int kMaxAutosaveSeconds = 3600;

    QString theme = QStringLiteral("orange");
    int displayScale = 100;
    int autosaveIntervalSeconds = 30;
    QTime dailyResetTime = QTime(9, 0);
    bool autostart = false;
    bool notifications = true;
    UpdateConfig updates;

    // Internal bookkeeping, never patchable from outside.
    QDateTime lastDailyReset;
    QDateTime lastAutomaticBackup;
};

struct SettingsPatch
{
    std::optional<QString> theme;
    std::optional<int> displayScale;
    std::optional<int> autosaveIntervalSeconds;
    std::optional<QTime> dailyResetTime;
    std::optional<bool> autostart;
    std::optional<bool> notifications;
    std::optional<QString> updateChannel;
    std::optional<bool> updateAutoCheck;

    bool isEmpty() const;

    // Throws core::ValidationError on unknown or internal fields and on
    // wrongly typed values.
    static SettingsPatch fromJson(const QJsonObject &object);
};

// Throws core::ValidationError when a value is out of range.
void validateSettings(const Settings &settings);
Settings applyPatch(Settings settings, const SettingsPatch &patch);

QJsonObject settingsToJson(const Settings &settings);
// Unknown keys are ignored and invalid values fall back to defaults.
Settings settingsFromJson(const QJsonObject &object);

} // namespace data
} // namespace taskvault
