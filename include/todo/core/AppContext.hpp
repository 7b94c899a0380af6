#pragma once

#include <memory>

#include "todo/core/StoreConfig.hpp"

namespace todo {
namespace data {
class JsonFileTaskStorage;
class TaskStore;
}

namespace core {

class AppContext
{
public:
    // Loads the store. Throws StorageReadError for an unreadable file.
    explicit AppContext(StoreConfig config);
    ~AppContext();

    const StoreConfig &config() const;
    data::TaskStore &taskStore();

private:
    StoreConfig m_config;
    std::shared_ptr<data::JsonFileTaskStorage> m_storage;
    std::unique_ptr<data::TaskStore> m_taskStore;
};

} // namespace core
} // namespace todo
