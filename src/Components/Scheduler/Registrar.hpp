//----------------------------------------------------------------------------------------------------------------------
// File: Registrar.hpp
// Description: Executes the work of registered services on the core thread. The thread that constructs the 
// registrar is the core thread, every callback delivered to a caller runs there. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <typeinfo>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Sentinel;
class Registrar;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Sentinel
{
public:
    Sentinel();
    virtual ~Sentinel() = default;

    virtual void Delist(Delegate::Identifier identifier) = 0;

    bool AwaitTask(std::chrono::milliseconds timeout);
    [[nodiscard]] std::size_t AvailableTasks() const;
    void OnTaskAvailable(std::size_t available);

protected:
    void OnTaskCompleted(std::size_t completed);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_waiter;
    std::atomic_size_t m_available;
};

//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Registrar : public Scheduler::Sentinel
{
public:
    using Delegates = std::vector<std::shared_ptr<Delegate>>;

    Registrar();

    // Runs each delegate with available work, returning the number of tasks completed. 
    std::size_t Execute();

    [[nodiscard]] bool IsCoreThread() const;

    template<typename ServiceType> requires std::is_class_v<ServiceType>
    std::shared_ptr<Delegate> Register(OnExecute const& callback);

    template<typename ServiceType> requires std::is_class_v<ServiceType>
    std::shared_ptr<Delegate> GetDelegate() const;

    // Sentinel {
    virtual void Delist(Delegate::Identifier identifier) override;
    // } Sentinel

private:
    [[nodiscard]] std::shared_ptr<Delegate> GetDelegate(Delegate::Identifier identifier) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::thread::id const m_core;
    mutable std::mutex m_mutex;
    Delegates m_delegates;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename ServiceType> requires std::is_class_v<ServiceType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::Register(OnExecute const& callback)
{
    assert(!GetDelegate<ServiceType>()); // Currently, only one delegate per service type is supported. 
    std::scoped_lock lock{ m_mutex };
    return m_delegates.emplace_back(std::make_shared<Delegate>(typeid(ServiceType).hash_code(), callback, this));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename ServiceType> requires std::is_class_v<ServiceType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Registrar::GetDelegate() const
{
    return GetDelegate(typeid(ServiceType).hash_code());
}

//----------------------------------------------------------------------------------------------------------------------
