//----------------------------------------------------------------------------------------------------------------------
// File: Registrar.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Registrar.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Sentinel::Sentinel()
    : m_mutex()
    , m_waiter()
    , m_available(0)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Sentinel::AwaitTask(std::chrono::milliseconds timeout)
{
    if (m_available) { return false; } // If there are ready tasks, there is no need to wait. 
    std::unique_lock lock(m_mutex);
    m_waiter.wait_for(lock, timeout, [this] { return m_available != 0; });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Sentinel::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskAvailable(std::size_t available)
{
    // Increment the count of available work. If this is the first notification of work we've had recently, try 
    // waking the core thread early in order to process the work as soon as possible. 
    if (auto const result = m_available += available; result == available) {
        std::scoped_lock lock(m_mutex);
        m_waiter.notify_one();
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskCompleted(std::size_t completed) { m_available -= completed; }

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Registrar::Registrar()
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_core(std::this_thread::get_id())
    , m_mutex()
    , m_delegates()
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Registrar::Execute()
{
    assert(IsCoreThread());

    auto const delegates = ( std::scoped_lock{ m_mutex }, m_delegates );

    std::size_t total = 0;
    constexpr auto ready = [] (auto const& delegate) -> bool { return delegate->IsReady(); };
    std::ranges::for_each(delegates | std::views::filter(ready), [this, &total] (auto const& delegate) { 
       std::size_t const executed = delegate->Execute({});
       OnTaskCompleted(executed);
       total += executed;
    });
    return total;
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Registrar::IsCoreThread() const { return std::this_thread::get_id() == m_core; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Registrar::Delist(Delegate::Identifier identifier)
{
    std::scoped_lock lock{ m_mutex };
    auto const itr = std::ranges::find_if(m_delegates, [&identifier] (auto const& delegate) {
        return delegate->GetIdentifier() == identifier;
    });

    if (itr != m_delegates.end()) { 
        OnTaskCompleted(itr->get()->AvailableTasks()); // The task count should not include tasks of delisted delegates.
        m_delegates.erase(itr);
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::GetDelegate(Delegate::Identifier identifier) const
{
    std::scoped_lock lock{ m_mutex };
    constexpr auto projection = [] (auto const& delegate) -> auto { return delegate->GetIdentifier(); };
    if (auto const itr = std::ranges::find(m_delegates, identifier, projection); itr != m_delegates.end()) {
        return *itr;
    }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------
