//----------------------------------------------------------------------------------------------------------------------
// File: Creator.hpp
// Description: Records the credentials produced by a login or registration and materializes the live session. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SessionParams.hpp"
#include "Components/Authentication/Credentials.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

class ISession;
class ISessionManager;
class ISessionStore;

namespace Core { class ServiceProvider; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Session {
//----------------------------------------------------------------------------------------------------------------------

class Creator;

//----------------------------------------------------------------------------------------------------------------------
} // Session namespace
//----------------------------------------------------------------------------------------------------------------------

class Session::Creator
{
public:
    explicit Creator(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider);

    // Note: The discovery information attached to the credentials overrides the addresses of the configuration. The 
    // parameters are stored before the session is materialized. 
    [[nodiscard]] std::shared_ptr<ISession> CreateSession(
        Authentication::Credentials const& credentials, Configuration::ServerConnectionConfig const& config) const;

    [[nodiscard]] static Configuration::ServerConnectionConfig ApplyDiscoveryInformation(
        Authentication::Credentials const& credentials, Configuration::ServerConnectionConfig const& config);

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<ISessionStore> m_spSessionStore;
    std::shared_ptr<ISessionManager> m_spSessionManager;
};

//----------------------------------------------------------------------------------------------------------------------
