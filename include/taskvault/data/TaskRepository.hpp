#pragma once

#include "taskvault/data/DocumentRepository.hpp"
#include "taskvault/data/Task.hpp"
#include "taskvault/data/TaskPatch.hpp"

#include <QDateTime>
#include <QHash>

#include <functional>
#include <optional>
#include <vector>

namespace taskvault {
namespace data {

struct TaskQuery
{
    std::optional<QString> project;
    std::optional<bool> completed;
    std::optional<QDate> scheduledOn;

    bool matches(const TaskItem &task) const;
};

class TaskRepository : public DocumentRepository
{
public:
    static constexpr int kMaxStrikesPerDay = 2;
    static constexpr int kMinDuration = 5;
    static constexpr int kMaxDuration = 480;
    static constexpr int kMaxTitleLength = 200;
    static constexpr int kMaxDescriptionLength = 1000;
    static constexpr int kMaxProjectLength = 100;

    explicit TaskRepository(std::shared_ptr<storage::EncryptedStore> store,
                            PersistMode mode = PersistMode::Immediate);
    ~TaskRepository() override;

    void setClock(std::function<QDateTime()> clock);

    std::vector<TaskItem> fetchTasks(const TaskQuery &query = TaskQuery()) const;
    std::optional<TaskItem> findById(const QString &id) const;
    int count() const;

    TaskItem addTask(const TaskDraft &draft);
    TaskItem updateTask(const QString &id, const TaskPatch &patch);
    bool removeTask(const QString &id);

    TaskItem strike(const QString &id, StrikeMode mode, const QString &report);
    TaskItem undoStrike(const QString &id);
    TaskItem complete(const QString &id);
    TaskItem uncomplete(const QString &id);
    TaskItem schedule(const QString &id, const QTime &start, const QDate &date, int durationMinutes);
    TaskItem unschedule(const QString &id);

    // Clears every struck-today flag and drops per-day counters older than
    // today. Returns the number of tasks that were struck.
    int clearStruckToday();

protected:
    QJsonDocument serializeLocked() const override;
    void deserializeLocked(const QJsonDocument &document) override;
    void resetLocked() override;

private:
    TaskItem &requireLocked(const QString &id);
    QDateTime now() const;

    QHash<QString, TaskItem> m_tasks;
    std::function<QDateTime()> m_clock;
};

} // namespace data
} // namespace taskvault
