#include "taskmgr/core/AppContext.hpp"

#include "taskmgr/data/InMemoryTaskRepository.hpp"

#include "taskmgr/core/TaskStore.hpp"

namespace taskmgr {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
    , m_taskStore(std::make_unique<TaskStore>(std::make_unique<data::InMemoryTaskRepository>(),
                                              m_settings.defaultPriority))
{
}

AppContext::~AppContext() = default;

TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace taskmgr
