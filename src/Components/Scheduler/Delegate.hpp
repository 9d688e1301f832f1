//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.hpp
// Description: The registrar's handle to a service that has work to execute on the core thread.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <functional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

using OnExecute = std::function<std::size_t()>;

class Delegate;
class Sentinel;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Delegate
{
public:
    using Identifier = std::size_t;

    // Note: Only the registrar should be used to execute the service. 
    class ExecuteKey { public: friend class Registrar; private: ExecuteKey() = default; };

    Delegate(Identifier identifier, OnExecute const& callback, Sentinel* const sentinel);

    [[nodiscard]] Identifier GetIdentifier() const;
    [[nodiscard]] std::size_t AvailableTasks() const;
    [[nodiscard]] bool IsReady() const;

    void OnTaskAvailable(std::size_t available = 1);
    [[nodiscard]] std::size_t Execute(ExecuteKey key);

    void Delist();

private:
    Identifier const m_identifier;
    std::atomic_size_t m_available;
    OnExecute const m_execute;
    Sentinel* const m_sentinel;
};

//----------------------------------------------------------------------------------------------------------------------
