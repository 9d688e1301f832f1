//----------------------------------------------------------------------------------------------------------------------
// File: Tasks.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <functional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class OneShotTask;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::OneShotTask
{
public:
    using Callback = std::function<void()>;

    explicit OneShotTask(Callback const& callback)
        : m_callback(callback)
    {
        assert(m_callback);
    }

    explicit OneShotTask(Callback&& callback)
        : m_callback(std::move(callback))
    {
        assert(m_callback);
    }

    void Execute() const { m_callback(); }

private:
    Callback m_callback;
};

//----------------------------------------------------------------------------------------------------------------------
