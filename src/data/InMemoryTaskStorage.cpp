#include "todo/data/InMemoryTaskStorage.hpp"

namespace todo {
namespace data {

InMemoryTaskStorage::InMemoryTaskStorage() = default;

InMemoryTaskStorage::InMemoryTaskStorage(std::vector<TaskRecord> snapshot)
    : m_snapshot(std::move(snapshot))
{
}

InMemoryTaskStorage::~InMemoryTaskStorage() = default;

std::vector<TaskRecord> InMemoryTaskStorage::load()
{
    return m_snapshot;
}

void InMemoryTaskStorage::save(const std::vector<TaskRecord> &tasks)
{
    m_snapshot = tasks;
    ++m_saveCount;
}

const std::vector<TaskRecord> &InMemoryTaskStorage::snapshot() const
{
    return m_snapshot;
}

std::size_t InMemoryTaskStorage::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace todo
