#include "todo/data/TaskStore.hpp"

#include "todo/core/Logging.hpp"
#include "todo/data/TaskStorage.hpp"

#include <algorithm>
#include <stdexcept>

namespace todo {
namespace data {

namespace {
const QString NO_DUE_DATE = QStringLiteral("9999-99-99");

const QString &sortableDueDate(const TaskRecord &task)
{
    return task.dueDate.isEmpty() ? NO_DUE_DATE : task.dueDate;
}
} // namespace

int TaskStats::pendingWithPriority(const QString &priority) const
{
    for (const auto &entry : byPriority) {
        if (entry.first == priority) {
            return entry.second;
        }
    }
    return 0;
}

TaskStore::TaskStore(std::shared_ptr<TaskStorage> storage)
    : m_storage(std::move(storage))
{
    if (!m_storage) {
        throw std::invalid_argument("TaskStore requires a storage backend");
    }
    load();
}

TaskStore::~TaskStore() = default;

void TaskStore::load()
{
    m_tasks = m_storage->load();
    int maxId = 0;
    for (const TaskRecord &task : m_tasks) {
        maxId = std::max(maxId, task.id);
    }
    m_nextId = maxId + 1;
}

void TaskStore::save()
{
    m_storage->save(m_tasks);
}

TaskRecord TaskStore::add(const QString &title,
                          const QString &priority,
                          const QString &dueDate,
                          const QString &category)
{
    TaskRecord task = makeTask(m_nextId, title, priority, dueDate, category);
    m_tasks.push_back(task);
    ++m_nextId;
    save();
    qCInfo(lcTodoData) << "Added task" << task.id;
    return task;
}

std::vector<TaskRecord> TaskStore::list(const TaskQuery &query) const
{
    const QString category = query.category.toLower();
    const QString priority = query.priority.toLower();

    std::vector<TaskRecord> result;
    for (const TaskRecord &task : m_tasks) {
        if (!query.showAll && task.completed) {
            continue;
        }
        if (!category.isEmpty() && task.category != category) {
            continue;
        }
        if (!priority.isEmpty() && task.priority != priority) {
            continue;
        }
        result.push_back(task);
    }

    std::stable_sort(result.begin(), result.end(), [](const TaskRecord &lhs, const TaskRecord &rhs) {
        const int lhsRank = priorityRank(lhs.priority);
        const int rhsRank = priorityRank(rhs.priority);
        if (lhsRank != rhsRank) {
            return lhsRank < rhsRank;
        }
        return sortableDueDate(lhs) < sortableDueDate(rhs);
    });
    return result;
}

bool TaskStore::complete(int id)
{
    return setCompleted(id, true);
}

bool TaskStore::uncomplete(int id)
{
    return setCompleted(id, false);
}

bool TaskStore::remove(int id)
{
    auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [id](const TaskRecord &task) {
        return task.id == id;
    });
    if (it == m_tasks.end()) {
        qCInfo(lcTodoData) << "No task with id" << id;
        return false;
    }
    m_tasks.erase(it);
    save();
    qCInfo(lcTodoData) << "Deleted task" << id;
    return true;
}

bool TaskStore::edit(int id, const TaskEdit &changes)
{
    TaskRecord *task = findById(id);
    if (!task) {
        qCInfo(lcTodoData) << "No task with id" << id;
        return false;
    }
    if (changes.title && !changes.title->isEmpty()) {
        task->title = *changes.title;
    }
    if (changes.priority && !changes.priority->isEmpty()) {
        task->priority = changes.priority->toLower();
    }
    if (changes.dueDate) {
        task->dueDate = *changes.dueDate;
    }
    if (changes.category && !changes.category->isEmpty()) {
        task->category = changes.category->toLower();
    }
    save();
    qCInfo(lcTodoData) << "Updated task" << id;
    return true;
}

TaskStats TaskStore::stats() const
{
    TaskStats stats;
    stats.byPriority = {
        qMakePair(QStringLiteral("high"), 0),
        qMakePair(QStringLiteral("medium"), 0),
        qMakePair(QStringLiteral("low"), 0),
    };

    stats.total = static_cast<int>(m_tasks.size());
    for (const TaskRecord &task : m_tasks) {
        if (task.completed) {
            ++stats.completed;
            continue;
        }
        auto entry = std::find_if(stats.byPriority.begin(), stats.byPriority.end(),
                                  [&task](const QPair<QString, int> &item) {
                                      return item.first == task.priority;
                                  });
        if (entry == stats.byPriority.end()) {
            stats.byPriority.append(qMakePair(task.priority, 1));
        } else {
            ++entry->second;
        }
        ++stats.byCategory[task.category];
    }
    stats.pending = stats.total - stats.completed;
    return stats;
}

int TaskStore::clearCompleted()
{
    const auto before = m_tasks.size();
    m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(),
                                 [](const TaskRecord &task) { return task.completed; }),
                  m_tasks.end());
    const int removed = static_cast<int>(before - m_tasks.size());
    if (removed > 0) {
        save();
        qCInfo(lcTodoData) << "Cleared" << removed << "completed task(s)";
    }
    return removed;
}

const std::vector<TaskRecord> &TaskStore::tasks() const
{
    return m_tasks;
}

int TaskStore::nextId() const
{
    return m_nextId;
}

TaskRecord *TaskStore::findById(int id)
{
    for (TaskRecord &task : m_tasks) {
        if (task.id == id) {
            return &task;
        }
    }
    return nullptr;
}

bool TaskStore::setCompleted(int id, bool completed)
{
    TaskRecord *task = findById(id);
    if (!task) {
        qCInfo(lcTodoData) << "No task with id" << id;
        return false;
    }
    task->completed = completed;
    save();
    qCInfo(lcTodoData) << (completed ? "Completed task" : "Reopened task") << id;
    return true;
}

} // namespace data
} // namespace todo
