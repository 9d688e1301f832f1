//----------------------------------------------------------------------------------------------------------------------
// File: Index.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Index.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Interfaces/Session.hpp"
#include "Interfaces/SessionManager.hpp"
#include "Interfaces/SessionStore.hpp"
//----------------------------------------------------------------------------------------------------------------------

Session::Index::Index(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider)
    : m_spSessionStore(spServiceProvider->Require<ISessionStore>())
    , m_spSessionManager(spServiceProvider->Require<ISessionManager>())
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Session::Index::HasAny() const { return m_spSessionStore->GetLast().has_value(); }

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<ISession> Session::Index::GetMostRecent() const
{
    auto const optParams = m_spSessionStore->GetLast();
    if (!optParams) { return nullptr; }
    return m_spSessionManager->GetOrCreateSession(*optParams);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::ServerConnectionConfig> Session::Index::GetConnectionConfig(
    std::string_view sessionId) const
{
    auto const optParams = m_spSessionStore->Get(sessionId);
    if (!optParams) { return {}; }
    return optParams->GetConnectionConfig();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Session::Index::ForEachSession(ReadFunction const& reader) const
{
    std::size_t read = 0;
    for (auto const& params : m_spSessionStore->GetAll()) {
        ++read;
        if (reader(params) != CallbackIteration::Continue) { break; }
    }
    return read;
}

//----------------------------------------------------------------------------------------------------------------------
