#include "todo/core/AppContext.hpp"

#include "todo/data/JsonFileTaskStorage.hpp"
#include "todo/data/TaskStore.hpp"

namespace todo {
namespace core {

AppContext::AppContext(StoreConfig config)
    : m_config(std::move(config))
    , m_storage(std::make_shared<data::JsonFileTaskStorage>(m_config.dataFile))
    , m_taskStore(std::make_unique<data::TaskStore>(m_storage))
{
}

AppContext::~AppContext() = default;

const StoreConfig &AppContext::config() const
{
    return m_config;
}

data::TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

} // namespace core
} // namespace todo
