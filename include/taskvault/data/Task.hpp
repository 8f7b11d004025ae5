#pragma once

#include <QDate>
#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QTime>
#include <QUuid>

#include <optional>

namespace taskvault {
namespace data {

enum class StrikeMode
{
    Today,
    Forever,
};

QString strikeModeToString(StrikeMode mode);
std::optional<StrikeMode> strikeModeFromString(const QString &value);

// A claimed block of time on one calendar day. Date and start hour only
// exist together.
struct ScheduleSlot
{
    QDate date;
    QTime start;
    int durationMinutes = 0;

    int startMinute() const;
    int endMinute() const;
    bool overlaps(const ScheduleSlot &other) const;
};

struct TaskItem
{
    QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QString title;
    QString description;
    QString project;
    QDate dueDate;
    int estimatedDuration = 60;
    std::optional<ScheduleSlot> slot;
    bool completed = false;
    QDateTime completedAt;
    bool struckToday = false;
    QDate struckDate;
    int strikeCount = 0;
    QMap<QDate, int> dailyStrikes;
    QString strikeReport;
    QDateTime createdAt = QDateTime::currentDateTime();

    int strikesOn(const QDate &day) const;
};

QJsonObject taskToJson(const TaskItem &task);
// Missing or malformed optional fields fall back to their defaults; a task
// without id or title yields nullopt.
std::optional<TaskItem> taskFromJson(const QJsonObject &object);

} // namespace data
} // namespace taskvault
