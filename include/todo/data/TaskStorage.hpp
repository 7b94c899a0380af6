#pragma once

#include <vector>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

class TaskStorage
{
public:
    virtual ~TaskStorage() = default;

    // Throws StorageReadError. An absent snapshot yields an empty list.
    virtual std::vector<TaskRecord> load() = 0;
    // Replaces the whole snapshot. Throws StorageWriteError.
    virtual void save(const std::vector<TaskRecord> &tasks) = 0;
};

} // namespace data
} // namespace todo
