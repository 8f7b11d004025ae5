#include "taskvault/data/TaskRepository.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QMutexLocker>

#include <algorithm>

namespace taskvault {
namespace data {

namespace {
constexpr auto DOCUMENT_NAME = "tasks";
constexpr int DOCUMENT_FORMAT = 1;
constexpr int MINUTES_PER_DAY = 24 * 60;

void checkLength(const QString &field, const QString &value, int maximum)
{
    if (value.size() > maximum) {
        throw core::ValidationError(field, QStringLiteral("must be at most %1 characters").arg(maximum));
    }
}

QString checkedTitle(const QString &title)
{
    const QString trimmed = title.trimmed();
    if (trimmed.isEmpty()) {
        throw core::ValidationError(QStringLiteral("title"), QStringLiteral("is required"));
    }
    checkLength(QStringLiteral("title"), trimmed, TaskRepository::kMaxTitleLength);
    return trimmed;
}

void checkDuration(const QString &field, int minutes)
{
    if (minutes < TaskRepository::kMinDuration || minutes > TaskRepository::kMaxDuration) {
        throw core::ValidationError(field,
                                    QStringLiteral("must be between %1 and %2 minutes")
                                        .arg(TaskRepository::kMinDuration)
                                        .arg(TaskRepository::kMaxDuration));
    }
}
} // namespace

bool TaskQuery::matches(const TaskItem &task) const
{
    if (project && task.project != *project) {
        return false;
    }
    if (completed && task.completed != *completed) {
        return false;
    }
    if (scheduledOn && (!task.slot || task.slot->date != *scheduledOn)) {
        return false;
    }
    return true;
}

TaskRepository::TaskRepository(std::shared_ptr<storage::EncryptedStore> store, PersistMode mode)
    : DocumentRepository(std::move(store), QLatin1String(DOCUMENT_NAME), mode)
    , m_clock([] { return QDateTime::currentDateTime(); })
{
}

TaskRepository::~TaskRepository() = default;

void TaskRepository::setClock(std::function<QDateTime()> clock)
{
    QMutexLocker locker(&stateMutex());
    m_clock = std::move(clock);
}

std::vector<TaskItem> TaskRepository::fetchTasks(const TaskQuery &query) const
{
    QMutexLocker locker(&stateMutex());
    std::vector<TaskItem> result;
    result.reserve(static_cast<size_t>(m_tasks.size()));
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        if (query.matches(it.value())) {
            result.push_back(it.value());
        }
    }
    std::sort(result.begin(), result.end(), [](const TaskItem &lhs, const TaskItem &rhs) {
        if (lhs.completed != rhs.completed) {
            return !lhs.completed;
        }
        if (lhs.createdAt == rhs.createdAt) {
            return lhs.title.toLower() < rhs.title.toLower();
        }
        return lhs.createdAt < rhs.createdAt;
    });
    return result;
}

std::optional<TaskItem> TaskRepository::findById(const QString &id) const
{
    QMutexLocker locker(&stateMutex());
    const auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int TaskRepository::count() const
{
    QMutexLocker locker(&stateMutex());
    return m_tasks.size();
}

TaskItem TaskRepository::addTask(const TaskDraft &draft)
{
    TaskItem task;
    task.title = checkedTitle(draft.title);
    task.description = draft.description.trimmed();
    task.project = draft.project.trimmed();
    checkLength(QStringLiteral("description"), task.description, kMaxDescriptionLength);
    checkLength(QStringLiteral("project"), task.project, kMaxProjectLength);
    checkDuration(QStringLiteral("estimated_duration"), draft.estimatedDuration);
    task.dueDate = draft.dueDate;
    task.estimatedDuration = draft.estimatedDuration;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        task.createdAt = now();
        m_tasks.insert(task.id, task);
        markDirtyLocked();
    }
    qCDebug(core::lcData) << "added task" << task.id;
    persistIfImmediate();
    return task;
}

TaskItem TaskRepository::updateTask(const QString &id, const TaskPatch &patch)
{
    TaskItem updated;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        updated = requireLocked(id);
        if (patch.title) {
            updated.title = checkedTitle(*patch.title);
        }
        if (patch.description) {
            updated.description = patch.description->trimmed();
            checkLength(QStringLiteral("description"), updated.description, kMaxDescriptionLength);
        }
        if (patch.project) {
            updated.project = patch.project->trimmed();
            checkLength(QStringLiteral("project"), updated.project, kMaxProjectLength);
        }
        if (patch.dueDate) {
            updated.dueDate = *patch.dueDate;
        }
        if (patch.estimatedDuration) {
            checkDuration(QStringLiteral("estimated_duration"), *patch.estimatedDuration);
            updated.estimatedDuration = *patch.estimatedDuration;
        }
        if (patch.isEmpty()) {
            return updated;
        }
        m_tasks.insert(id, updated);
        markDirtyLocked();
    }
    persistIfImmediate();
    return updated;
}

bool TaskRepository::removeTask(const QString &id)
{
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        if (m_tasks.remove(id) == 0) {
            return false;
        }
        markDirtyLocked();
    }
    qCDebug(core::lcData) << "removed task" << id;
    persistIfImmediate();
    return true;
}

TaskItem TaskRepository::strike(const QString &id, StrikeMode mode, const QString &report)
{
    const QString trimmedReport = report.trimmed();
    if (trimmedReport.isEmpty()) {
        throw core::ValidationError(QStringLiteral("report"), QStringLiteral("is required"));
    }

    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        const QDateTime timestamp = now();
        const QDate today = timestamp.date();

        if (mode == StrikeMode::Forever) {
            if (task.completed) {
                return task;
            }
            task.completed = true;
            task.completedAt = timestamp;
            task.struckToday = false;
            task.struckDate = QDate();
        } else {
            if (task.completed) {
                throw core::ValidationError(QStringLiteral("mode"),
                                            QStringLiteral("completed tasks cannot be struck for today"));
            }
            const int todays = task.strikesOn(today);
            if (todays >= kMaxStrikesPerDay) {
                throw core::LimitExceeded(id, kMaxStrikesPerDay);
            }
            task.dailyStrikes.insert(today, todays + 1);
            task.struckToday = true;
            task.struckDate = today;
        }
        task.strikeReport = trimmedReport;
        ++task.strikeCount;
        result = task;
        markDirtyLocked();
    }
    qCDebug(core::lcData) << "struck task" << id << strikeModeToString(mode);
    persistIfImmediate();
    return result;
}

TaskItem TaskRepository::undoStrike(const QString &id)
{
    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        const QDate today = now().date();
        const int todays = task.strikesOn(today);
        if (todays == 0) {
            throw core::ValidationError(QStringLiteral("strike"), QStringLiteral("no strike recorded today"));
        }
        if (todays == 1) {
            task.dailyStrikes.remove(today);
            task.struckToday = false;
            task.struckDate = QDate();
            task.strikeReport.clear();
        } else {
            task.dailyStrikes.insert(today, todays - 1);
        }
        result = task;
        markDirtyLocked();
    }
    persistIfImmediate();
    return result;
}

TaskItem TaskRepository::complete(const QString &id)
{
    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        if (task.completed) {
            return task;
        }
        task.completed = true;
        task.completedAt = now();
        task.struckToday = false;
        task.struckDate = QDate();
        result = task;
        markDirtyLocked();
    }
    persistIfImmediate();
    return result;
}

TaskItem TaskRepository::uncomplete(const QString &id)
{
    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        if (!task.completed) {
            return task;
        }
        task.completed = false;
        task.completedAt = QDateTime();
        result = task;
        markDirtyLocked();
    }
    persistIfImmediate();
    return result;
}

TaskItem TaskRepository::schedule(const QString &id, const QTime &start, const QDate &date, int durationMinutes)
{
    if (!date.isValid()) {
        throw core::ValidationError(QStringLiteral("scheduled_date"), QStringLiteral("invalid date"));
    }
    if (!start.isValid()) {
        throw core::ValidationError(QStringLiteral("scheduled_hour"), QStringLiteral("invalid time"));
    }
    checkDuration(QStringLiteral("duration"), durationMinutes);
    const ScheduleSlot slot{date, QTime(start.hour(), start.minute()), durationMinutes};
    if (slot.endMinute() > MINUTES_PER_DAY) {
        throw core::ValidationError(QStringLiteral("duration"), QStringLiteral("slot runs past midnight"));
    }

    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        if (task.completed) {
            throw core::ValidationError(QStringLiteral("id"), QStringLiteral("completed tasks cannot be scheduled"));
        }
        for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
            const TaskItem &other = it.value();
            if (other.id == id || other.completed || !other.slot) {
                continue;
            }
            if (other.slot->overlaps(slot)) {
                throw core::SlotConflict(other.id, other.title);
            }
        }
        task.slot = slot;
        result = task;
        markDirtyLocked();
    }
    qCDebug(core::lcData) << "scheduled task" << id << date << start;
    persistIfImmediate();
    return result;
}

TaskItem TaskRepository::unschedule(const QString &id)
{
    TaskItem result;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        TaskItem &task = requireLocked(id);
        if (!task.slot) {
            return task;
        }
        task.slot.reset();
        result = task;
        markDirtyLocked();
    }
    persistIfImmediate();
    return result;
}

int TaskRepository::clearStruckToday()
{
    int cleared = 0;
    bool changed = false;
    {
        QMutexLocker locker(&stateMutex());
        ensureAvailableLocked();
        const QDate today = now().date();
        for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
            TaskItem &task = it.value();
            if (task.struckToday) {
                task.struckToday = false;
                task.struckDate = QDate();
                ++cleared;
                changed = true;
            }
            for (auto day = task.dailyStrikes.begin(); day != task.dailyStrikes.end();) {
                if (day.key() < today) {
                    day = task.dailyStrikes.erase(day);
                    changed = true;
                } else {
                    ++day;
                }
            }
        }
        if (changed) {
            markDirtyLocked();
        }
    }
    qCInfo(core::lcData) << "daily reset cleared" << cleared << "struck tasks";
    if (changed) {
        persistIfImmediate();
    }
    return cleared;
}

QJsonDocument TaskRepository::serializeLocked() const
{
    QJsonArray tasks;
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        tasks.append(taskToJson(it.value()));
    }
    QJsonObject root;
    root.insert(QStringLiteral("format"), DOCUMENT_FORMAT);
    root.insert(QStringLiteral("tasks"), tasks);
    return QJsonDocument(root);
}

void TaskRepository::deserializeLocked(const QJsonDocument &document)
{
    m_tasks.clear();
    const QJsonArray tasks = document.object().value(QStringLiteral("tasks")).toArray();
    for (const QJsonValue &value : tasks) {
        std::optional<TaskItem> task = taskFromJson(value.toObject());
        if (!task) {
            qCWarning(core::lcData) << "skipping malformed task record";
            continue;
        }
        m_tasks.insert(task->id, *task);
    }
    qCInfo(core::lcData) << "loaded" << m_tasks.size() << "tasks";
}

void TaskRepository::resetLocked()
{
    m_tasks.clear();
}

TaskItem &TaskRepository::requireLocked(const QString &id)
{
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        throw core::NotFound(QStringLiteral("task"), id);
    }
    return it.value();
}

QDateTime TaskRepository::now() const
{
    return m_clock();
}

} // namespace data
} // namespace taskvault
