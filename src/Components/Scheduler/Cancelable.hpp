//----------------------------------------------------------------------------------------------------------------------
// File: Cancelable.hpp
// Description: A handle returned for asynchronous work. Cancelling suppresses the delivery of the result, it does not 
// abort work that has already started (e.g. an in-flight request). 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Cancelable;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Cancelable
{
public:
    Cancelable() : m_cancelled(false) {}

    Cancelable(Cancelable const&) = delete;
    Cancelable& operator=(Cancelable const&) = delete;

    void Cancel() { m_cancelled = true; }
    [[nodiscard]] bool IsCancelled() const { return m_cancelled; }

private:
    std::atomic_bool m_cancelled;
};

//----------------------------------------------------------------------------------------------------------------------
