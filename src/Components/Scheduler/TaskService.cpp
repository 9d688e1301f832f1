//----------------------------------------------------------------------------------------------------------------------
// File: TaskService.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "TaskService.hpp"
#include "Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::TaskService::TaskService(std::shared_ptr<Registrar> const& spRegistrar)
    : m_spDelegate()
    , m_mutex()
    , m_tasks()
{
    assert(spRegistrar);
    m_spDelegate = spRegistrar->Register<TaskService>([this] () -> std::size_t { return Execute(); }); 
    assert(m_spDelegate);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::TaskService::~TaskService()
{
    m_spDelegate->Delist();
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::TaskService::Schedule(OneShotTask::Callback const& callback)
{
    {
        std::scoped_lock lock(m_mutex);
        m_tasks.emplace_back(std::make_unique<OneShotTask>(callback));
    }
    m_spDelegate->OnTaskAvailable();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::TaskService::Execute()
{
    // Tasks scheduled while executing the current set are deferred to the next cycle. 
    auto const tasks = ( std::scoped_lock{ m_mutex }, std::exchange(m_tasks, {}) );
    std::ranges::for_each(tasks, [] (auto const& upTask) { upTask->Execute(); });
    return tasks.size();
}

//----------------------------------------------------------------------------------------------------------------------
