#pragma once

#include <cstddef>

#include "todo/data/TaskStorage.hpp"

namespace todo {
namespace data {

class InMemoryTaskStorage : public TaskStorage
{
public:
    InMemoryTaskStorage();
    explicit InMemoryTaskStorage(std::vector<TaskRecord> snapshot);
    ~InMemoryTaskStorage() override;

    std::vector<TaskRecord> load() override;
    void save(const std::vector<TaskRecord> &tasks) override;

    const std::vector<TaskRecord> &snapshot() const;
    std::size_t saveCount() const;

private:
    std::vector<TaskRecord> m_snapshot;
    std::size_t m_saveCount = 0;
};

} // namespace data
} // namespace todo
