#include "taskvault/data/Task.hpp"

#include <QJsonValue>

namespace taskvault {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr auto HOUR_FORMAT = "HH:mm";

QString formatDate(const QDate &date)
{
    return date.isValid() ? date.toString(QLatin1String(DATE_FORMAT)) : QString();
}

QDate parseDate(const QJsonValue &value)
{
    return QDate::fromString(value.toString(), QLatin1String(DATE_FORMAT));
}

QJsonValue optionalDate(const QDate &date)
{
    return date.isValid() ? QJsonValue(formatDate(date)) : QJsonValue(QJsonValue::Null);
}

QJsonValue optionalDateTime(const QDateTime &dt)
{
    return dt.isValid() ? QJsonValue(dt.toString(Qt::ISODate)) : QJsonValue(QJsonValue::Null);
}
} // namespace

QString strikeModeToString(StrikeMode mode)
{
    switch (mode) {
    case StrikeMode::Forever:
        return QStringLiteral("forever");
    case StrikeMode::Today:
    default:
        return QStringLiteral("today");
    }
}

std::optional<StrikeMode> strikeModeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("today")) {
        return StrikeMode::Today;
    }
    if (normalized == QLatin1String("forever")) {
        return StrikeMode::Forever;
    }
    return std::nullopt;
}

int ScheduleSlot::startMinute() const
{
    return start.hour() * 60 + start.minute();
}

int ScheduleSlot::endMinute() const
{
    return startMinute() + durationMinutes;
}

bool ScheduleSlot::overlaps(const ScheduleSlot &other) const
{
    if (date != other.date) {
        return false;
    }
    return startMinute() < other.endMinute() && other.startMinute() < endMinute();
}

int TaskItem::strikesOn(const QDate &day) const
{
    return dailyStrikes.value(day, 0);
}

QJsonObject taskToJson(const TaskItem &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), task.id);
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("description"), task.description);
    object.insert(QStringLiteral("project"), task.project);
    object.insert(QStringLiteral("due_date"), optionalDate(task.dueDate));
    object.insert(QStringLiteral("estimated_duration"), task.estimatedDuration);
    if (task.slot) {
        object.insert(QStringLiteral("scheduled_date"), formatDate(task.slot->date));
        object.insert(QStringLiteral("scheduled_hour"), task.slot->start.toString(QLatin1String(HOUR_FORMAT)));
        object.insert(QStringLiteral("scheduled_duration"), task.slot->durationMinutes);
    } else {
        object.insert(QStringLiteral("scheduled_date"), QJsonValue(QJsonValue::Null));
        object.insert(QStringLiteral("scheduled_hour"), QJsonValue(QJsonValue::Null));
        object.insert(QStringLiteral("scheduled_duration"), QJsonValue(QJsonValue::Null));
    }
    object.insert(QStringLiteral("completed"), task.completed);
    object.insert(QStringLiteral("completed_at"), optionalDateTime(task.completedAt));
    object.insert(QStringLiteral("struck_today"), task.struckToday);
    object.insert(QStringLiteral("struck_date"), optionalDate(task.struckDate));
    object.insert(QStringLiteral("strike_count"), task.strikeCount);
    QJsonObject daily;
    for (auto it = task.dailyStrikes.constBegin(); it != task.dailyStrikes.constEnd(); ++it) {
        daily.insert(formatDate(it.key()), it.value());
    }
    object.insert(QStringLiteral("daily_strikes"), daily);
    object.insert(QStringLiteral("strike_report"), task.strikeReport);
    object.insert(QStringLiteral("created_at"), optionalDateTime(task.createdAt));
    return object;
}

std::optional<TaskItem> taskFromJson(const QJsonObject &object)
{
    TaskItem task;
    task.id = object.value(QStringLiteral("id")).toString();
    task.title = object.value(QStringLiteral("title")).toString();
    if (task.id.isEmpty() || task.title.isEmpty()) {
        return std::nullopt;
    }
    task.description = object.value(QStringLiteral("description")).toString();
    task.project = object.value(QStringLiteral("project")).toString();
    task.dueDate = parseDate(object.value(QStringLiteral("due_date")));
    task.estimatedDuration = object.value(QStringLiteral("estimated_duration")).toInt(60);

    const QDate slotDate = parseDate(object.value(QStringLiteral("scheduled_date")));
    const QTime slotStart = QTime::fromString(object.value(QStringLiteral("scheduled_hour")).toString(),
                                              QLatin1String(HOUR_FORMAT));
    const int slotDuration = object.value(QStringLiteral("scheduled_duration")).toInt(0);
    if (slotDate.isValid() && slotStart.isValid() && slotDuration > 0) {
        task.slot = ScheduleSlot{slotDate, slotStart, slotDuration};
    }

    task.completed = object.value(QStringLiteral("completed")).toBool(false);
    task.completedAt = QDateTime::fromString(object.value(QStringLiteral("completed_at")).toString(), Qt::ISODate);
    task.struckToday = object.value(QStringLiteral("struck_today")).toBool(false);
    task.struckDate = parseDate(object.value(QStringLiteral("struck_date")));
    task.strikeCount = qMax(0, object.value(QStringLiteral("strike_count")).toInt(0));
    const QJsonObject daily = object.value(QStringLiteral("daily_strikes")).toObject();
    for (auto it = daily.constBegin(); it != daily.constEnd(); ++it) {
        const QDate day = QDate::fromString(it.key(), QLatin1String(DATE_FORMAT));
        const int count = it.value().toInt(0);
        if (day.isValid() && count > 0) {
            task.dailyStrikes.insert(day, count);
        }
    }
    task.strikeReport = object.value(QStringLiteral("strike_report")).toString();
    const QDateTime created = QDateTime::fromString(object.value(QStringLiteral("created_at")).toString(), Qt::ISODate);
    if (created.isValid()) {
        task.createdAt = created;
    }
    return task;
}

} // namespace data
} // namespace taskvault
