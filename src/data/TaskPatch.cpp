#include "taskvault/data/TaskPatch.hpp"

#include "taskvault/core/Errors.hpp"

#include <QJsonValue>
#include <QSet>

#include <cmath>
#include <limits>

namespace taskvault {
namespace data {

namespace {
const QSet<QString> &allowedFields()
{
    static const QSet<QString> fields{
        QStringLiteral("title"),
        QStringLiteral("description"),
        QStringLiteral("project"),
        QStringLiteral("due_date"),
        QStringLiteral("estimated_duration"),
    };
    return fields;
}

void rejectUnknownFields(const QJsonObject &object)
{
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (!allowedFields().contains(it.key())) {
            throw core::ValidationError(it.key(), QStringLiteral("unknown field"));
        }
    }
}

QString requireString(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isString()) {
        throw core::ValidationError(key, QStringLiteral("must be a string"));
    }
    return value.toString();
}

int requireInt(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    const double number = value.toDouble(std::nan(""));
    if (!value.isDouble() || std::floor(number) != number) {
        throw core::ValidationError(key, QStringLiteral("must be an integer"));
    }
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        throw core::ValidationError(key, QStringLiteral("is out of range"));
    }
    return static_cast<int>(number);
}

QDate parseDueDate(const QJsonObject &object)
{
    const QJsonValue value = object.value(QStringLiteral("due_date"));
    if (value.isNull()) {
        return QDate();
    }
    const QDate date = QDate::fromString(requireString(object, QStringLiteral("due_date")), Qt::ISODate);
    if (!date.isValid()) {
        throw core::ValidationError(QStringLiteral("due_date"), QStringLiteral("invalid date format"));
    }
    return date;
}
} // namespace

TaskDraft TaskDraft::fromJson(const QJsonObject &object)
{
    rejectUnknownFields(object);
    TaskDraft draft;
    draft.title = requireString(object, QStringLiteral("title"));
    if (object.contains(QStringLiteral("description"))) {
        draft.description = requireString(object, QStringLiteral("description"));
    }
    if (object.contains(QStringLiteral("project"))) {
        draft.project = requireString(object, QStringLiteral("project"));
    }
    if (object.contains(QStringLiteral("due_date"))) {
        draft.dueDate = parseDueDate(object);
    }
    if (object.contains(QStringLiteral("estimated_duration"))) {
        draft.estimatedDuration = requireInt(object, QStringLiteral("estimated_duration"));
    }
    return draft;
}

bool TaskPatch::isEmpty() const
{
    return !title && !description && !project && !dueDate && !estimatedDuration;
}

TaskPatch TaskPatch::fromJson(const QJsonObject &object)
{
    rejectUnknownFields(object);
    TaskPatch patch;
    if (object.contains(QStringLiteral("title"))) {
        patch.title = requireString(object, QStringLiteral("title"));
    }
    if (object.contains(QStringLiteral("description"))) {
        patch.description = requireString(object, QStringLiteral("description"));
    }
    if (object.contains(QStringLiteral("project"))) {
        patch.project = requireString(object, QStringLiteral("project"));
    }
    if (object.contains(QStringLiteral("due_date"))) {
        patch.dueDate = parseDueDate(object);
    }
    if (object.contains(QStringLiteral("estimated_duration"))) {
        patch.estimatedDuration = requireInt(object, QStringLiteral("estimated_duration"));
    }
    return patch;
}

} // namespace data
} // namespace taskvault
