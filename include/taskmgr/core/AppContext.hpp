#pragma once

#include <memory>

#include "taskmgr/core/Settings.hpp"

namespace taskmgr {
namespace core {

class TaskStore;

class AppContext
{
public:
    explicit AppContext(Settings settings = Settings());
    ~AppContext();

    TaskStore &taskStore();
    const Settings &settings() const;

private:
    Settings m_settings;
    std::unique_ptr<TaskStore> m_taskStore;
};

} // namespace core
} // namespace taskmgr
