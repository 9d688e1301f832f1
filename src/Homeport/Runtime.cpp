//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Runtime.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Authentication/PendingSession.hpp"
#include "Components/Authentication/Service.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Configuration/PendingSessionPersistor.hpp"
#include "Components/Configuration/SessionPersistor.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Discovery/Orchestrator.hpp"
#include "Components/Discovery/WellKnownResolver.hpp"
#include "Components/Scheduler/Dispatcher.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Components/Scheduler/TaskService.hpp"
#include "Components/Session/Creator.hpp"
#include "Components/Session/Index.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Interfaces/SessionManager.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

bool Homeport::InitializeLogger(Configuration::Parser const& parser)
{
    Logger::Initialize(parser.GetVerbosity(), true);
    if (auto const& optLogFilepath = parser.GetLogFilepath(); optLogFilepath) {
        return Logger::AttachFileSink(*optLogFilepath);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Homeport::Runtime::Runtime(
    Configuration::Parser const& parser,
    std::shared_ptr<IClientFactory> const& spClientFactory,
    std::shared_ptr<ISessionManager> const& spSessionManager)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spServiceProvider(std::make_shared<Core::ServiceProvider>())
    , m_spRegistrar(std::make_shared<Scheduler::Registrar>())
    , m_spTaskService(std::make_shared<Scheduler::TaskService>(m_spRegistrar))
    , m_spDispatcher()
    , m_spAuthenticationService()
    , m_resources()
{
    assert(m_logger);
    if (!parser.Validated()) { throw std::invalid_argument("The runtime requires validated options."); }
    if (!spClientFactory || !spSessionManager) { throw std::invalid_argument("The runtime requires a transport."); }

    m_spDispatcher = std::make_shared<Scheduler::Dispatcher>(
        m_spTaskService, parser.GetBackgroundThreads(), parser.GetComputationThreads());
    m_spServiceProvider->Register(m_spDispatcher);
    m_spServiceProvider->Register<IClientFactory>(spClientFactory);
    m_spServiceProvider->Register<ISessionManager>(spSessionManager);

    // The records are kept in memory alone when the options disable the filesystem. 
    auto const spPendingStore = std::make_shared<Configuration::PendingSessionPersistor>(
        parser.GetPendingSessionFilepath());
    m_spServiceProvider->Register<IPendingSessionStore>(spPendingStore);

    auto const spSessionStore = std::make_shared<Configuration::SessionPersistor>(parser.GetSessionsFilepath());
    m_spServiceProvider->Register<ISessionStore>(spSessionStore);

    auto const spResolver = std::make_shared<Discovery::WellKnownResolver>(spClientFactory);
    m_spServiceProvider->Register<IWellKnownResolver>(spResolver);

    auto const spOrchestrator = std::make_shared<Discovery::Orchestrator>(spClientFactory, spResolver);
    m_spServiceProvider->Register(spOrchestrator);

    auto const spCreator = std::make_shared<Session::Creator>(m_spServiceProvider);
    m_spServiceProvider->Register(spCreator);

    auto const spIndex = std::make_shared<Session::Index>(m_spServiceProvider);
    m_spServiceProvider->Register(spIndex);

    auto const spPendingSession = std::make_shared<Authentication::PendingSession>(m_spServiceProvider);
    m_spServiceProvider->Register(spPendingSession);

    m_spAuthenticationService = std::make_shared<Authentication::Service>(m_spServiceProvider);
    m_spServiceProvider->Register(m_spAuthenticationService);

    m_resources = { spClientFactory, spSessionManager, spPendingStore, spSessionStore, spResolver, spOrchestrator,
        spCreator, spIndex, spPendingSession };

    m_logger->info("The homeport runtime has been initialized.");
}

//----------------------------------------------------------------------------------------------------------------------

Homeport::Runtime::~Runtime() { Shutdown(); }

//----------------------------------------------------------------------------------------------------------------------

Authentication::Service& Homeport::Runtime::GetAuthenticationService() const
{
    assert(m_spAuthenticationService);
    return *m_spAuthenticationService;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Core::ServiceProvider> const& Homeport::Runtime::GetServiceProvider() const
{
    return m_spServiceProvider;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Homeport::Runtime::Execute() { return m_spRegistrar->Execute(); }

//----------------------------------------------------------------------------------------------------------------------

bool Homeport::Runtime::AwaitTask(std::chrono::milliseconds timeout) { return m_spRegistrar->AwaitTask(timeout); }

//----------------------------------------------------------------------------------------------------------------------

void Homeport::Runtime::Shutdown()
{
    if (m_spDispatcher) { m_spDispatcher->Shutdown(); }
}

//----------------------------------------------------------------------------------------------------------------------
