//----------------------------------------------------------------------------------------------------------------------
// File: Service.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Service.hpp"
#include "PendingSession.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Discovery/Orchestrator.hpp"
#include "Components/Scheduler/Dispatcher.hpp"
#include "Components/Session/Creator.hpp"
#include "Components/Session/Index.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Interfaces/Session.hpp"
#include "Interfaces/WellKnownResolver.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

Authentication::Service::Service(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spDispatcher(spServiceProvider->Require<Scheduler::Dispatcher>())
    , m_spOrchestrator(spServiceProvider->Require<Discovery::Orchestrator>())
    , m_spResolver(spServiceProvider->Require<IWellKnownResolver>())
    , m_spClientFactory(spServiceProvider->Require<IClientFactory>())
    , m_spPendingSession(spServiceProvider->Require<PendingSession>())
    , m_spIndex(spServiceProvider->Require<Session::Index>())
    , m_spCreator(spServiceProvider->Require<Session::Creator>())
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::Service::DiscoverLoginFlow(
    Configuration::ServerConnectionConfig const& config, LoginFlowCallback const& callback)
{
    using Result = Failure::Expected<Discovery::Resolution>;

    m_logger->info("Discovering the login flows of {}.", config.GetHomeServerUri().ToString());
    m_spPendingSession->Clear();

    auto work = [spOrchestrator = m_spOrchestrator, config] () -> Result { return spOrchestrator->Discover(config); };

    auto complete = [wpPendingSession = std::weak_ptr{ m_spPendingSession }, callback] (Result&& result) {
        if (auto const* const pReason = Failure::GetReason(result); pReason) {
            callback(Failure::Reason{ *pReason });
            return;
        }

        auto& resolution = std::get<Discovery::Resolution>(result);
        if (std::holds_alternative<Discovery::LoginFlow::Success>(resolution.result)) {
            if (auto const spPendingSession = wpPendingSession.lock(); spPendingSession) {
                spPendingSession->Set(resolution.config);
            }
        }

        callback(std::move(resolution.result));
    };

    return m_spDispatcher->Launch<Result>(Scheduler::Context::Background, std::move(work), std::move(complete));
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::Service::DiscoverLoginFlowForSession(
    std::string_view sessionId, LoginFlowCallback const& callback)
{
    auto const optConfig = m_spIndex->GetConnectionConfig(sessionId);
    if (!optConfig) {
        m_logger->warn("Unable to discover the login flows of an unknown session: {}.", sessionId);
        callback(Failure::Reason{ Failure::SessionNotFound{ std::string{ sessionId } } });
        return std::make_shared<Scheduler::Cancelable>();
    }

    return DiscoverLoginFlow(*optConfig, callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Authentication::LoginWizard> Authentication::Service::GetLoginWizard()
{
    return m_spPendingSession->GetLoginWizard();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Authentication::RegistrationWizard> Authentication::Service::GetRegistrationWizard()
{
    return m_spPendingSession->GetRegistrationWizard();
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::Service::IsRegistrationStarted() const { return m_spPendingSession->IsRegistrationStarted(); }

//----------------------------------------------------------------------------------------------------------------------

void Authentication::Service::CancelPendingLoginOrRegistration() { m_spPendingSession->Cancel(); }

//----------------------------------------------------------------------------------------------------------------------

void Authentication::Service::Reset() { m_spPendingSession->Reset(); }

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::Service::HasAuthenticatedSessions() const { return m_spIndex->HasAny(); }

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<ISession> Authentication::Service::GetLastAuthenticatedSession() const
{
    return m_spIndex->GetMostRecent();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::Service::CreateSessionFromSso(
    Configuration::ServerConnectionConfig const& config, Credentials const& credentials, SessionCallback const& callback)
{
    using Result = Failure::Expected<std::shared_ptr<ISession>>;
    auto work = [spCreator = m_spCreator, config, credentials] () -> Result {
        return spCreator->CreateSession(credentials, config);
    };
    return m_spDispatcher->Launch<Result>(Scheduler::Context::Computation, std::move(work), callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::Service::GetWellKnownData(
    std::string_view matrixId,
    std::optional<Configuration::ServerConnectionConfig> const& optConfig,
    WellKnownCallback const& callback)
{
    using Result = Failure::Expected<Discovery::WellKnownResult>;
    auto work = [spResolver = m_spResolver, matrixId = std::string{ matrixId }, optConfig] () -> Result {
        return spResolver->Resolve(matrixId, optConfig);
    };
    return m_spDispatcher->Launch<Result>(Scheduler::Context::Background, std::move(work), callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::Service::DirectAuthentication(
    Configuration::ServerConnectionConfig const& config,
    std::string_view matrixId,
    std::string_view password,
    std::string_view deviceName,
    SessionCallback const& callback)
{
    using Result = Failure::Expected<std::shared_ptr<ISession>>;

    auto const spClient = std::make_shared<Api::Client>(
        m_spClientFactory->BuildClient(config), config.GetHomeServerUri());

    auto work = [logger = m_logger, spClient, spCreator = m_spCreator, config,
        body = LoginWizard::CreatePasswordLogin(matrixId, password, deviceName)] () -> Result
    {
        auto credentials = spClient->Login(body);
        if (auto const* const pReason = Failure::GetReason(credentials); pReason) {
            logger->warn("The direct login was rejected. Reason: {}", Failure::ToString(*pReason));

            // A certificate is reported against the address the caller provided, such that it may be trusted. 
            if (auto const* const pCertificate = std::get_if<Failure::UnrecognizedCertificate>(pReason); pCertificate) {
                return Failure::Reason{ Failure::UnrecognizedCertificate{
                    config.GetHomeServerUri().ToString(), pCertificate->fingerprint } };
            }
            return *pReason;
        }
        return spCreator->CreateSession(std::get<Credentials>(credentials), config);
    };

    return m_spDispatcher->Launch<Result>(Scheduler::Context::Background, std::move(work), callback);
}

//----------------------------------------------------------------------------------------------------------------------
