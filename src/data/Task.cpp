#include "todo/data/Task.hpp"

#include "todo/data/StorageError.hpp"

#include <QDateTime>
#include <QJsonValue>
#include <QSet>
#include <QStringList>
#include <cmath>
#include <limits>

namespace todo {
namespace data {

namespace {
constexpr auto KEY_ID = "id";
constexpr auto KEY_TITLE = "title";
constexpr auto KEY_PRIORITY = "priority";
constexpr auto KEY_DUE_DATE = "due_date";
constexpr auto KEY_CATEGORY = "category";
constexpr auto KEY_COMPLETED = "completed";
constexpr auto KEY_CREATED_AT = "created_at";

QString requireString(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        throw RecordFormatError(QStringLiteral("missing required field '%1'").arg(key));
    }
    if (!value.isString()) {
        throw RecordFormatError(QStringLiteral("field '%1' must be a string").arg(key));
    }
    return value.toString();
}

QString optionalString(const QJsonObject &object, const QString &key, const QString &fallback)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw RecordFormatError(QStringLiteral("field '%1' must be a string or null").arg(key));
    }
    return value.toString();
}

int requireId(const QJsonObject &object)
{
    const QString key = QLatin1String(KEY_ID);
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        throw RecordFormatError(QStringLiteral("missing required field '%1'").arg(key));
    }
    // The largest id stays below INT_MAX so the next id is representable.
    const double number = value.toDouble(-1.0);
    if (!value.isDouble() || number < 1.0 || std::floor(number) != number
        || number >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw RecordFormatError(QStringLiteral("field '%1' must be a positive integer").arg(key));
    }
    return static_cast<int>(number);
}
} // namespace

bool operator==(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.priority == rhs.priority
           && lhs.dueDate == rhs.dueDate && lhs.category == rhs.category
           && lhs.completed == rhs.completed && lhs.createdAt == rhs.createdAt;
}

bool operator!=(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return !(lhs == rhs);
}

TaskRecord makeTask(int id,
                    const QString &title,
                    const QString &priority,
                    const QString &dueDate,
                    const QString &category)
{
    TaskRecord task;
    task.id = id;
    task.title = title;
    task.priority = priority.toLower();
    task.dueDate = dueDate;
    task.category = category.toLower();
    task.createdAt = currentTimestamp();
    return task;
}

QJsonObject toJson(const TaskRecord &task)
{
    QJsonObject object;
    object.insert(QLatin1String(KEY_ID), task.id);
    object.insert(QLatin1String(KEY_TITLE), task.title);
    object.insert(QLatin1String(KEY_PRIORITY), task.priority);
    object.insert(QLatin1String(KEY_DUE_DATE),
                  task.dueDate.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(task.dueDate));
    object.insert(QLatin1String(KEY_CATEGORY), task.category);
    object.insert(QLatin1String(KEY_COMPLETED), task.completed);
    object.insert(QLatin1String(KEY_CREATED_AT), task.createdAt);
    return object;
}

TaskRecord taskFromJson(const QJsonObject &object)
{
    static const QSet<QString> knownKeys = {
        QLatin1String(KEY_ID),       QLatin1String(KEY_TITLE),     QLatin1String(KEY_PRIORITY),
        QLatin1String(KEY_DUE_DATE), QLatin1String(KEY_CATEGORY),  QLatin1String(KEY_COMPLETED),
        QLatin1String(KEY_CREATED_AT),
    };

    QStringList unknown;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (!knownKeys.contains(it.key())) {
            unknown << it.key();
        }
    }
    if (!unknown.isEmpty()) {
        throw RecordFormatError(QStringLiteral("unknown field(s): %1").arg(unknown.join(QStringLiteral(", "))));
    }

    TaskRecord task;
    task.id = requireId(object);
    task.title = requireString(object, QLatin1String(KEY_TITLE));
    task.priority = optionalString(object, QLatin1String(KEY_PRIORITY), task.priority).toLower();
    task.dueDate = optionalString(object, QLatin1String(KEY_DUE_DATE), QString());
    task.category = optionalString(object, QLatin1String(KEY_CATEGORY), task.category).toLower();

    const QJsonValue completed = object.value(QLatin1String(KEY_COMPLETED));
    if (!completed.isUndefined()) {
        if (!completed.isBool()) {
            throw RecordFormatError(QStringLiteral("field '%1' must be a boolean").arg(QLatin1String(KEY_COMPLETED)));
        }
        task.completed = completed.toBool();
    }

    task.createdAt = optionalString(object, QLatin1String(KEY_CREATED_AT), QString());
    if (task.createdAt.isEmpty()) {
        task.createdAt = currentTimestamp();
    }
    return task;
}

int priorityRank(const QString &priority)
{
    if (priority == QLatin1String("high")) {
        return 0;
    }
    if (priority == QLatin1String("medium")) {
        return 1;
    }
    if (priority == QLatin1String("low")) {
        return 2;
    }
    return 3;
}

QString currentTimestamp()
{
    return QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
}

} // namespace data
} // namespace todo
