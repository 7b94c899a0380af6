#pragma once

#include <QString>

#include "todo/data/TaskStorage.hpp"

namespace todo {
namespace data {

class JsonFileTaskStorage : public TaskStorage
{
public:
    explicit JsonFileTaskStorage(QString filePath);
    ~JsonFileTaskStorage() override = default;

    std::vector<TaskRecord> load() override;
    void save(const std::vector<TaskRecord> &tasks) override;

    const QString &filePath() const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace todo
