#pragma once

#include <QDate>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace taskvault {
namespace data {

struct TaskDraft
{
    QString title;
    QString description;
    QString project;
    QDate dueDate;
    int estimatedDuration = 60;

    // Throws core::ValidationError on unknown fields or wrong types.
    static TaskDraft fromJson(const QJsonObject &object);
};

// Only the engaged fields are applied. An engaged but invalid dueDate clears
// the due date.
struct TaskPatch
{
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<QString> project;
    std::optional<QDate> dueDate;
    std::optional<int> estimatedDuration;

    bool isEmpty() const;

    // Throws core::ValidationError on unknown fields or wrong types.
    static TaskPatch fromJson(const QJsonObject &object);
};

} // namespace data
} // namespace taskvault
