//----------------------------------------------------------------------------------------------------------------------
// File: Service.hpp
// Description: The entry point used by an application to discover a homeserver, authenticate with it, and resume the
// sessions that were authenticated previously. Every asynchronous result is delivered on the main context. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "LoginWizard.hpp"
#include "RegistrationWizard.hpp"
#include "Credentials.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Discovery/Outcome.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;
class ISession;
class IWellKnownResolver;

namespace Core { class ServiceProvider; }
namespace Discovery { class Orchestrator; }
namespace Scheduler { class Cancelable; class Dispatcher; }
namespace Session { class Creator; class Index; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class PendingSession;
class Service;

using LoginFlowCallback = std::function<void(Failure::Expected<Discovery::LoginFlowResult>&& result)>;
using WellKnownCallback = std::function<void(Failure::Expected<Discovery::WellKnownResult>&& result)>;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

class Authentication::Service
{
public:
    explicit Service(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider);

    // Note: Any pending login or registration is discarded before the homeserver is probed. When the login flows 
    // are resolved the discovered configuration becomes the pending session before the callback is invoked. 
    std::shared_ptr<Scheduler::Cancelable> DiscoverLoginFlow(
        Configuration::ServerConnectionConfig const& config, LoginFlowCallback const& callback);

    // Repeats the discovery with the configuration of a stored session. An unknown session is reported to the
    // callback immediately. 
    std::shared_ptr<Scheduler::Cancelable> DiscoverLoginFlowForSession(
        std::string_view sessionId, LoginFlowCallback const& callback);

    [[nodiscard]] std::shared_ptr<LoginWizard> GetLoginWizard();
    [[nodiscard]] std::shared_ptr<RegistrationWizard> GetRegistrationWizard();
    [[nodiscard]] bool IsRegistrationStarted() const;

    void CancelPendingLoginOrRegistration();
    void Reset();

    [[nodiscard]] bool HasAuthenticatedSessions() const;
    [[nodiscard]] std::shared_ptr<ISession> GetLastAuthenticatedSession() const;

    std::shared_ptr<Scheduler::Cancelable> CreateSessionFromSso(
        Configuration::ServerConnectionConfig const& config,
        Credentials const& credentials,
        SessionCallback const& callback);

    std::shared_ptr<Scheduler::Cancelable> GetWellKnownData(
        std::string_view matrixId,
        std::optional<Configuration::ServerConnectionConfig> const& optConfig,
        WellKnownCallback const& callback);

    // Logs in without a prior discovery. The homeserver of the configuration is used as provided. 
    std::shared_ptr<Scheduler::Cancelable> DirectAuthentication(
        Configuration::ServerConnectionConfig const& config,
        std::string_view matrixId,
        std::string_view password,
        std::string_view deviceName,
        SessionCallback const& callback);

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<Scheduler::Dispatcher> m_spDispatcher;
    std::shared_ptr<Discovery::Orchestrator> m_spOrchestrator;
    std::shared_ptr<IWellKnownResolver> m_spResolver;
    std::shared_ptr<IClientFactory> m_spClientFactory;
    std::shared_ptr<PendingSession> m_spPendingSession;
    std::shared_ptr<Session::Index> m_spIndex;
    std::shared_ptr<Session::Creator> m_spCreator;
};

//----------------------------------------------------------------------------------------------------------------------
