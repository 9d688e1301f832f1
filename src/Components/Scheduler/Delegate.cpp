//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
#include "Registrar.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Delegate(Identifier identifier, OnExecute const& callback, Sentinel* const sentinel)
    : m_identifier(identifier)
    , m_available(0)
    , m_execute(callback)
    , m_sentinel(sentinel)
{
    assert(m_execute);
    assert(m_sentinel);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Identifier Scheduler::Delegate::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Delegate::IsReady() const { return m_available != 0; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::OnTaskAvailable(std::size_t available)
{
    m_available += available;
    m_sentinel->OnTaskAvailable(available);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::Execute([[maybe_unused]] ExecuteKey key)
{
    std::size_t const completed = m_execute();
    m_available -= completed; // Decrement the amount of work available by the number completed. 
    return completed; // Provide the registrar the units of work completed. 
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::Delist()
{
    assert(m_sentinel);
    m_sentinel->Delist(m_identifier);
}

//----------------------------------------------------------------------------------------------------------------------
