//----------------------------------------------------------------------------------------------------------------------
// File: Index.hpp
// Description: Read access to the sessions that have previously been authenticated. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SessionParams.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Utilities/CallbackIteration.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ISession;
class ISessionManager;
class ISessionStore;

namespace Core { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Session {
//----------------------------------------------------------------------------------------------------------------------

class Index;

//----------------------------------------------------------------------------------------------------------------------
} // Session namespace
//----------------------------------------------------------------------------------------------------------------------

class Session::Index
{
public:
    using ReadFunction = std::function<CallbackIteration(Params const& params)>;

    explicit Index(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider);

    [[nodiscard]] bool HasAny() const;
    [[nodiscard]] std::shared_ptr<ISession> GetMostRecent() const;
    [[nodiscard]] std::optional<Configuration::ServerConnectionConfig> GetConnectionConfig(
        std::string_view sessionId) const;

    // Iterates the stored sessions from the least to the most recently saved. Returns the number of records read. 
    std::size_t ForEachSession(ReadFunction const& reader) const;

private:
    std::shared_ptr<ISessionStore> m_spSessionStore;
    std::shared_ptr<ISessionManager> m_spSessionManager;
};

//----------------------------------------------------------------------------------------------------------------------
