//----------------------------------------------------------------------------------------------------------------------
// File: Orchestrator.hpp
// Description: Sequences the discovery strategies into a single fallback chain and resolves the login flows of the
// server that was found. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Outcome.hpp"
#include "Strategy.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;
class IWellKnownResolver;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class Orchestrator;

// The outcome of a discovery along with the configuration of the server that produced it. When the outcome is a
// success, the configuration's homeserver is the resolved homeserver url. 
struct Resolution
{
    Configuration::ServerConnectionConfig config;
    LoginFlowResult result;
};

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::Orchestrator
{
public:
    using Strategies = std::vector<std::unique_ptr<IStrategy>>;

    // Builds the standard chain: direct, legacy client configuration, and then the domain's discovery document. 
    Orchestrator(
        std::shared_ptr<IClientFactory> const& spClientFactory,
        std::shared_ptr<IWellKnownResolver> const& spResolver);

    explicit Orchestrator(Strategies&& strategies);

    // Note: The strategies are attempted in order. The first strategy to resolve a candidate or fail outright ends 
    // the chain, only a strategy reporting not found (i.e. an HTTP 404) allows the next one to be attempted. All 
    // probes are issued from the calling thread. 
    [[nodiscard]] Failure::Expected<Resolution> Discover(Configuration::ServerConnectionConfig const& config) const;

    [[nodiscard]] Strategies const& GetStrategies() const;

private:
    [[nodiscard]] Failure::Expected<Resolution> ResolveLoginFlows(Candidate const& candidate) const;

    std::shared_ptr<spdlog::logger> m_logger;
    Strategies m_strategies;
};

//----------------------------------------------------------------------------------------------------------------------
