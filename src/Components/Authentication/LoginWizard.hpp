//----------------------------------------------------------------------------------------------------------------------
// File: LoginWizard.hpp
// Description: Authenticates an existing account against the pending homeserver. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ISession;

namespace Api { class Client; }
namespace Scheduler { class Cancelable; class Dispatcher; }
namespace Session { class Creator; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class LoginWizard;

namespace LoginTypes {
    constexpr std::string_view Password = "m.login.password";
    constexpr std::string_view Token = "m.login.token";
}

namespace Identifiers {
    constexpr std::string_view User = "m.id.user";
    constexpr std::string_view ThirdParty = "m.id.thirdparty";
}

using SessionCallback = std::function<void(Failure::Expected<std::shared_ptr<ISession>>&& result)>;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

class Authentication::LoginWizard
{
public:
    LoginWizard(
        std::shared_ptr<Api::Client> const& spClient,
        Configuration::ServerConnectionConfig const& config,
        std::shared_ptr<Scheduler::Dispatcher> const& spDispatcher,
        std::shared_ptr<Session::Creator> const& spCreator);

    // Note: A login that looks like an email address (e.g. "alice@example.org") is sent as a third party identifier,
    // anything else is sent as a user identifier.  
    std::shared_ptr<Scheduler::Cancelable> Login(
        std::string_view login, std::string_view password, std::string_view deviceName, SessionCallback const& callback);

    // Completes a single sign-on with the login token provided by the homeserver. 
    std::shared_ptr<Scheduler::Cancelable> LoginWithToken(std::string_view token, SessionCallback const& callback);

    [[nodiscard]] static boost::json::object CreatePasswordLogin(
        std::string_view login, std::string_view password, std::string_view deviceName);
    [[nodiscard]] static boost::json::object CreateTokenLogin(std::string_view token);

private:
    std::shared_ptr<Scheduler::Cancelable> Perform(boost::json::object&& body, SessionCallback const& callback);

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<Api::Client> m_spClient;
    Configuration::ServerConnectionConfig m_config;
    std::shared_ptr<Scheduler::Dispatcher> m_spDispatcher;
    std::shared_ptr<Session::Creator> m_spCreator;
};

//----------------------------------------------------------------------------------------------------------------------
