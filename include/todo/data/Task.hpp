#pragma once

#include <QJsonObject>
#include <QString>

namespace todo {
namespace data {

struct TaskRecord
{
    int id = 0;
    QString title;
    QString priority = QStringLiteral("medium");
    QString dueDate; // ISO YYYY-MM-DD, empty when absent
    QString category = QStringLiteral("general");
    bool completed = false;
    QString createdAt;
};

bool operator==(const TaskRecord &lhs, const TaskRecord &rhs);
bool operator!=(const TaskRecord &lhs, const TaskRecord &rhs);

/**
 * Builds a fresh record. Priority and category are lowercased, the creation
 * timestamp is set to the current local time.
 */
TaskRecord makeTask(int id,
                    const QString &title,
                    const QString &priority = QStringLiteral("medium"),
                    const QString &dueDate = QString(),
                    const QString &category = QStringLiteral("general"));

QJsonObject toJson(const TaskRecord &task);

/**
 * Reads a record field by field. `id` and `title` are required, unknown keys
 * and mistyped values throw RecordFormatError.
 */
TaskRecord taskFromJson(const QJsonObject &object);

// high=0, medium=1, low=2, anything else=3
int priorityRank(const QString &priority);

QString currentTimestamp();

} // namespace data
} // namespace todo
