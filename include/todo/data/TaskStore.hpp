#pragma once

#include <QMap>
#include <QPair>
#include <QString>
#include <QVector>
#include <memory>
#include <optional>
#include <vector>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

class TaskStorage;

struct TaskQuery
{
    bool showAll = false;
    QString category; // empty: no filter
    QString priority; // empty: no filter
};

/**
 * Fields to change on an existing task. Title, priority and category are
 * only applied when non-empty. A due date that is present is always applied,
 * so an empty string clears it.
 */
struct TaskEdit
{
    std::optional<QString> title;
    std::optional<QString> priority;
    std::optional<QString> dueDate;
    std::optional<QString> category;
};

struct TaskStats
{
    int total = 0;
    int completed = 0;
    int pending = 0;
    // Pending tasks only. Seeded with high, medium, low.
    QVector<QPair<QString, int>> byPriority;
    // Pending tasks only. Categories without pending tasks are absent.
    QMap<QString, int> byCategory;

    int pendingWithPriority(const QString &priority) const;
};

/**
 * Owns the ordered task list and writes the full snapshot back to its
 * storage after every change. Id lookups are linear scans.
 */
class TaskStore
{
public:
    explicit TaskStore(std::shared_ptr<TaskStorage> storage);
    ~TaskStore();

    void load();
    void save();

    TaskRecord add(const QString &title,
                   const QString &priority = QStringLiteral("medium"),
                   const QString &dueDate = QString(),
                   const QString &category = QStringLiteral("general"));
    std::vector<TaskRecord> list(const TaskQuery &query = TaskQuery()) const;
    bool complete(int id);
    bool uncomplete(int id);
    bool remove(int id);
    bool edit(int id, const TaskEdit &changes);
    TaskStats stats() const;
    int clearCompleted();

    const std::vector<TaskRecord> &tasks() const;
    int nextId() const;

private:
    TaskRecord *findById(int id);
    bool setCompleted(int id, bool completed);

    std::shared_ptr<TaskStorage> m_storage;
    std::vector<TaskRecord> m_tasks;
    int m_nextId = 1;
};

} // namespace data
} // namespace todo
