//----------------------------------------------------------------------------------------------------------------------
// File: TaskService.hpp
// Description: A queue of one shot tasks executed on the core thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <mutex>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Delegate;
class Registrar;
class TaskService;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::TaskService
{
public:
    explicit TaskService(std::shared_ptr<Registrar> const& spRegistrar);
    ~TaskService();

    TaskService(TaskService const&) = delete;
    TaskService& operator=(TaskService const&) = delete;

    // Note: Safe to call from any thread. The callback will be executed on the next cycle of the core thread. 
    void Schedule(OneShotTask::Callback const& callback);

private:
    using Tasks = std::vector<std::unique_ptr<OneShotTask>>;

    [[nodiscard]] std::size_t Execute();

    std::shared_ptr<Delegate> m_spDelegate;
    mutable std::mutex m_mutex;
    Tasks m_tasks;
};

//----------------------------------------------------------------------------------------------------------------------
