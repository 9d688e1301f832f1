//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.hpp
// Description: Builds the discovery and authentication services from a validated set of options. The application
// provides the HTTP transport and the session materialization, everything else is owned by the runtime. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;
class ISessionManager;

namespace Authentication { class Service; }
namespace Configuration { class Parser; }
namespace Core { class ServiceProvider; }
namespace Scheduler { class Dispatcher; class Registrar; class TaskService; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Homeport {
//----------------------------------------------------------------------------------------------------------------------

class Runtime;

// Registers the core logger using the verbosity and log file of the options. 
[[nodiscard]] bool InitializeLogger(Configuration::Parser const& parser);

//----------------------------------------------------------------------------------------------------------------------
} // Homeport namespace
//----------------------------------------------------------------------------------------------------------------------

// Note: The runtime must be constructed on the thread that will drive it, results are only delivered from Execute.
class Homeport::Runtime
{
public:
    Runtime(
        Configuration::Parser const& parser,
        std::shared_ptr<IClientFactory> const& spClientFactory,
        std::shared_ptr<ISessionManager> const& spSessionManager);
    ~Runtime();

    Runtime(Runtime const&) = delete;
    Runtime& operator=(Runtime const&) = delete;

    [[nodiscard]] Authentication::Service& GetAuthenticationService() const;
    [[nodiscard]] std::shared_ptr<Core::ServiceProvider> const& GetServiceProvider() const;

    // Delivers any results that have become available, returning the number of tasks completed. 
    std::size_t Execute();

    // Blocks until a result is available or the timeout elapses. 
    bool AwaitTask(std::chrono::milliseconds timeout);

    void Shutdown();

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<Core::ServiceProvider> m_spServiceProvider;
    std::shared_ptr<Scheduler::Registrar> m_spRegistrar;
    std::shared_ptr<Scheduler::TaskService> m_spTaskService;
    std::shared_ptr<Scheduler::Dispatcher> m_spDispatcher;
    std::shared_ptr<Authentication::Service> m_spAuthenticationService;
    std::vector<std::shared_ptr<void>> m_resources; // Services referenced weakly through the provider. 
};

//----------------------------------------------------------------------------------------------------------------------
