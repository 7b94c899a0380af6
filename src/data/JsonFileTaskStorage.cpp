#include "todo/data/JsonFileTaskStorage.hpp"

#include "todo/core/Logging.hpp"
#include "todo/data/StorageError.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace todo {
namespace data {

JsonFileTaskStorage::JsonFileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &JsonFileTaskStorage::filePath() const
{
    return m_filePath;
}

std::vector<TaskRecord> JsonFileTaskStorage::load()
{
    std::vector<TaskRecord> tasks;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcTodoData) << "No data file at" << m_filePath << "- starting empty";
        return tasks;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcTodoData) << "Cannot open" << m_filePath << file.errorString();
        throw StorageReadError(m_filePath, file.errorString());
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(lcTodoData) << "Malformed data file" << m_filePath << parseError.errorString();
        throw StorageReadError(m_filePath,
                               QStringLiteral("invalid JSON at offset %1: %2")
                                   .arg(parseError.offset)
                                   .arg(parseError.errorString()));
    }
    if (!document.isArray()) {
        qCWarning(lcTodoData) << "Data file" << m_filePath << "does not hold a JSON array";
        throw StorageReadError(m_filePath, QStringLiteral("expected a JSON array of tasks"));
    }

    const QJsonArray array = document.array();
    tasks.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue value = array.at(i);
        if (!value.isObject()) {
            qCWarning(lcTodoData) << "Task entry" << i << "in" << m_filePath << "is not an object";
            throw StorageReadError(m_filePath, QStringLiteral("entry %1 is not an object").arg(i));
        }
        try {
            tasks.push_back(taskFromJson(value.toObject()));
        } catch (const RecordFormatError &error) {
            qCWarning(lcTodoData) << "Invalid task entry" << i << "in" << m_filePath << error.what();
            throw StorageReadError(m_filePath,
                                   QStringLiteral("entry %1: %2").arg(i).arg(QString::fromUtf8(error.what())));
        }
    }

    qCDebug(lcTodoData) << "Loaded" << tasks.size() << "task(s) from" << m_filePath;
    return tasks;
}

void JsonFileTaskStorage::save(const std::vector<TaskRecord> &tasks)
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcTodoData) << "Cannot create directory" << dir.path();
        throw StorageWriteError(m_filePath, QStringLiteral("cannot create directory %1").arg(dir.path()));
    }

    QJsonArray array;
    for (const TaskRecord &task : tasks) {
        array.append(toJson(task));
    }
    const QByteArray payload = QJsonDocument(array).toJson(QJsonDocument::Indented);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcTodoData) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        throw StorageWriteError(m_filePath, file.errorString());
    }
    if (file.write(payload) != payload.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        qCWarning(lcTodoData) << "Short write to" << m_filePath << reason;
        throw StorageWriteError(m_filePath, reason);
    }
    if (!file.commit()) {
        qCWarning(lcTodoData) << "Cannot commit" << m_filePath << file.errorString();
        throw StorageWriteError(m_filePath, file.errorString());
    }

    qCDebug(lcTodoData) << "Saved" << tasks.size() << "task(s) to" << m_filePath;
}

} // namespace data
} // namespace todo
