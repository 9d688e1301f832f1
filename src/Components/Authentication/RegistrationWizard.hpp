//----------------------------------------------------------------------------------------------------------------------
// File: RegistrationWizard.hpp
// Description: Walks the user-interactive authentication stages required to register an account with the pending 
// homeserver. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Registration.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

class ISession;

namespace Api { class Client; }
namespace Scheduler { class Cancelable; class Dispatcher; }
namespace Session { class Creator; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class PendingSession;
class RegistrationWizard;

struct RegistrationSuccess
{
    std::shared_ptr<ISession> spSession;
};

// A registration either completes or reports the stages that remain. 
using RegistrationResult = std::variant<RegistrationSuccess, FlowResult>;
using RegistrationCallback = std::function<void(Failure::Expected<RegistrationResult>&& result)>;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

class Authentication::RegistrationWizard
{
public:
    RegistrationWizard(
        std::weak_ptr<PendingSession> const& wpPendingSession,
        std::uint64_t generation,
        std::shared_ptr<Api::Client> const& spClient,
        Configuration::ServerConnectionConfig const& config,
        std::shared_ptr<Scheduler::Dispatcher> const& spDispatcher,
        std::shared_ptr<Session::Creator> const& spCreator);

    [[nodiscard]] bool IsRegistrationStarted() const;
    [[nodiscard]] std::optional<std::string> GetCurrentSession() const;

    std::shared_ptr<Scheduler::Cancelable> FetchRegistrationFlow(RegistrationCallback const& callback);
    std::shared_ptr<Scheduler::Cancelable> CreateAccount(
        std::string_view username,
        std::string_view password,
        std::string_view deviceName,
        RegistrationCallback const& callback);

    // Note: The following stages continue the registration session started by the server. A StateError is thrown if
    // neither FetchRegistrationFlow nor CreateAccount has produced one. 
    std::shared_ptr<Scheduler::Cancelable> PerformReCaptcha(
        std::string_view response, RegistrationCallback const& callback);
    std::shared_ptr<Scheduler::Cancelable> AcceptTerms(RegistrationCallback const& callback);
    std::shared_ptr<Scheduler::Cancelable> Dummy(RegistrationCallback const& callback);

private:
    [[nodiscard]] boost::json::object CreateStageBody(std::string_view type) const;
    std::shared_ptr<Scheduler::Cancelable> Perform(
        boost::json::object&& body, bool startsRegistration, RegistrationCallback const& callback);

    std::shared_ptr<spdlog::logger> m_logger;
    std::weak_ptr<PendingSession> m_wpPendingSession;
    std::uint64_t m_generation;
    std::shared_ptr<Api::Client> m_spClient;
    Configuration::ServerConnectionConfig m_config;
    std::shared_ptr<Scheduler::Dispatcher> m_spDispatcher;
    std::shared_ptr<Session::Creator> m_spCreator;
};

//----------------------------------------------------------------------------------------------------------------------
