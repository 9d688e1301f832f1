//----------------------------------------------------------------------------------------------------------------------
// File: Orchestrator.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Orchestrator.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Interfaces/WellKnownResolver.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Certificate failures are reported against the address the caller supplied, even when the failure occurred while
// probing a redirected server, such that the caller can prompt to trust the address it knows about. 
[[nodiscard]] Failure::Reason Normalize(Failure::Reason&& reason, Configuration::ServerConnectionConfig const& config);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Discovery::Orchestrator::Orchestrator(
    std::shared_ptr<IClientFactory> const& spClientFactory,
    std::shared_ptr<IWellKnownResolver> const& spResolver)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_strategies()
{
    assert(m_logger);
    m_strategies.emplace_back(std::make_unique<DirectStrategy>(spClientFactory));
    m_strategies.emplace_back(std::make_unique<LegacyConfigStrategy>(spClientFactory));
    m_strategies.emplace_back(std::make_unique<WellKnownStrategy>(spClientFactory, spResolver));
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Orchestrator::Orchestrator(Strategies&& strategies)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_strategies(std::move(strategies))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::Resolution> Discovery::Orchestrator::Discover(
    Configuration::ServerConnectionConfig const& config) const
{
    auto const& address = config.GetHomeServerUri().ToString();
    m_logger->debug("Starting discovery for {}.", address);

    for (auto const& upStrategy : m_strategies) {
        m_logger->debug("Attempting the {} strategy for {}.", upStrategy->GetName(), address);

        auto result = upStrategy->Attempt(config);
        if (std::holds_alternative<NotFound>(result)) {
            m_logger->debug("The {} strategy found nothing for {}.", upStrategy->GetName(), address);
            continue;
        }

        if (auto* const pReason = std::get_if<Failure::Reason>(&result); pReason) {
            auto reason = local::Normalize(std::move(*pReason), config);
            m_logger->warn(
                "Discovery for {} failed during the {} strategy: {}.",
                address, upStrategy->GetName(), Failure::ToString(reason));
            return reason;
        }

        auto const& candidate = std::get<Candidate>(result);
        m_logger->debug("The {} strategy resolved {} to {}.", upStrategy->GetName(), address, candidate.homeServerUrl);

        auto resolution = ResolveLoginFlows(candidate);
        if (auto* const pReason = std::get_if<Failure::Reason>(&resolution); pReason) {
            auto reason = local::Normalize(std::move(*pReason), config);
            m_logger->warn("Failed to fetch the login flows of {}: {}.", candidate.homeServerUrl, Failure::ToString(reason));
            return reason;
        }
        return resolution;
    }

    m_logger->warn("Discovery for {} exhausted every strategy.", address);
    return Failure::NotFound();
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Orchestrator::Strategies const& Discovery::Orchestrator::GetStrategies() const { return m_strategies; }

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::Resolution> Discovery::Orchestrator::ResolveLoginFlows(Candidate const& candidate) const
{
    auto config = candidate.config.WithHomeServerUri(candidate.homeServerUrl);
    if (!candidate.versions.IsSupportedByClient()) {
        m_logger->info("The homeserver at {} does not support a compatible version.", candidate.homeServerUrl);
        return Resolution{ std::move(config), LoginFlow::OutdatedHomeserver{} };
    }

    assert(candidate.spClient);
    auto flows = candidate.spClient->FetchLoginFlows();
    if (auto const* const pReason = Failure::GetReason(flows); pReason) { return *pReason; }

    LoginFlow::Success success{
        .loginFlows = std::get<std::vector<std::string>>(std::move(flows)),
        .supportsLoginAndRegistration = candidate.versions.IsLoginAndRegistrationSupported(),
        .homeServerUrl = candidate.homeServerUrl
    };

    return Resolution{ std::move(config), std::move(success) };
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Reason local::Normalize(Failure::Reason&& reason, Configuration::ServerConnectionConfig const& config)
{
    if (auto* const pCertificate = std::get_if<Failure::UnrecognizedCertificate>(&reason); pCertificate) {
        pCertificate->uri = config.GetHomeServerUri().ToString();
    }
    return std::move(reason);
}

//----------------------------------------------------------------------------------------------------------------------
