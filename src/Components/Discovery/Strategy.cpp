//----------------------------------------------------------------------------------------------------------------------
// File: Strategy.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Strategy.hpp"
#include "Outcome.hpp"
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

[[nodiscard]] std::shared_ptr<Api::Client> BuildApiClient(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config);

// Probes the versions of the configuration's homeserver. Any failure is returned as is, the caller decides whether 
// a 404 means not found. 
[[nodiscard]] Failure::Expected<Discovery::Candidate> Probe(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config, std::string_view homeServerUrl);

// Probes a server found through a redirect. A redirect target that can't be probed is a definitive failure.  
[[nodiscard]] Discovery::StrategyResult ProbeRedirect(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config, std::string_view homeServerUrl);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Discovery::DirectStrategy {
//----------------------------------------------------------------------------------------------------------------------

Discovery::DirectStrategy::DirectStrategy(std::shared_ptr<IClientFactory> const& spClientFactory)
    : m_spClientFactory(spClientFactory)
{
    assert(m_spClientFactory);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Discovery::DirectStrategy::GetName() const { return Name; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::StrategyResult Discovery::DirectStrategy::Attempt(Configuration::ServerConnectionConfig const& config) const
{
    auto result = local::Probe(*m_spClientFactory, config, config.GetHomeServerUri().ToString());
    if (auto const* const pReason = Failure::GetReason(result); pReason) {
        if (Failure::IsNotFound(*pReason)) { return NotFound{}; }
        return *pReason;
    }
    return std::get<Candidate>(std::move(result));
}

//----------------------------------------------------------------------------------------------------------------------
// } Discovery::DirectStrategy
//----------------------------------------------------------------------------------------------------------------------
// Discovery::LegacyConfigStrategy {
//----------------------------------------------------------------------------------------------------------------------

Discovery::LegacyConfigStrategy::LegacyConfigStrategy(std::shared_ptr<IClientFactory> const& spClientFactory)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spClientFactory(spClientFactory)
{
    assert(m_logger);
    assert(m_spClientFactory);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Discovery::LegacyConfigStrategy::GetName() const { return Name; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::StrategyResult Discovery::LegacyConfigStrategy::Attempt(
    Configuration::ServerConnectionConfig const& config) const
{
    auto const spClient = local::BuildApiClient(*m_spClientFactory, config);
    auto const result = spClient->FetchLegacyConfig();
    if (auto const* const pReason = Failure::GetReason(result); pReason) {
        if (Failure::IsNotFound(*pReason)) { return NotFound{}; }
        return *pReason;
    }

    // A web client deployment without a default homeserver (e.g. a multi-server deployment) can't be followed.  
    auto const& document = std::get<LegacyConfig>(result);
    if (!document.HasDefaultHomeServer()) {
        m_logger->debug("The client configuration at {} has no default homeserver.", config.GetHomeServerUri().ToString());
        return NotFound{};
    }

    auto const& url = *document.defaultHomeServerUrl;
    m_logger->debug("The client configuration at {} redirects to {}.", config.GetHomeServerUri().ToString(), url);

    // A redirect target that doesn't serve the versions endpoint leaves the well-known step to be tried.
    auto redirected = local::Probe(*m_spClientFactory, config.WithHomeServerUri(url), url);
    if (auto const* const pReason = Failure::GetReason(redirected); pReason) {
        if (Failure::IsNotFound(*pReason)) { return NotFound{}; }
        return *pReason;
    }
    return std::get<Candidate>(std::move(redirected));
}

//----------------------------------------------------------------------------------------------------------------------
// } Discovery::LegacyConfigStrategy
//----------------------------------------------------------------------------------------------------------------------
// Discovery::WellKnownStrategy {
//----------------------------------------------------------------------------------------------------------------------

Discovery::WellKnownStrategy::WellKnownStrategy(
    std::shared_ptr<IClientFactory> const& spClientFactory,
    std::shared_ptr<IWellKnownResolver> const& spResolver)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spClientFactory(spClientFactory)
    , m_spResolver(spResolver)
{
    assert(m_logger);
    assert(m_spClientFactory);
    assert(m_spResolver);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Discovery::WellKnownStrategy::GetName() const { return Name; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::StrategyResult Discovery::WellKnownStrategy::Attempt(Configuration::ServerConnectionConfig const& config) const
{
    auto const& optDomain = config.GetHomeServerUri().GetHost();
    if (!optDomain) { return Failure::NotFound(); }

    std::string const matrixId = std::string{ WellKnownProbeUser } + *optDomain;
    auto const result = m_spResolver->Resolve(matrixId, config);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto const* const pPrompt = std::get_if<WellKnown::Prompt>(&std::get<WellKnownResult>(result));
    if (!pPrompt) {
        m_logger->debug("The domain {} does not provide a usable discovery document.", *optDomain);
        return Failure::NotFound();
    }

    m_logger->debug("The discovery document of {} points to {}.", *optDomain, pPrompt->homeServerUrl);
    auto const redirected = config
        .WithHomeServerUri(pPrompt->homeServerUrl)
        .WithIdentityServerUri(pPrompt->identityServerUrl);
    return local::ProbeRedirect(*m_spClientFactory, redirected, pPrompt->homeServerUrl);
}

//----------------------------------------------------------------------------------------------------------------------
// } Discovery::WellKnownStrategy
//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Api::Client> local::BuildApiClient(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config)
{
    return std::make_shared<Api::Client>(factory.BuildClient(config), config.GetHomeServerUri());
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::Candidate> local::Probe(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config, std::string_view homeServerUrl)
{
    auto spClient = BuildApiClient(factory, config);
    auto result = spClient->FetchVersions();
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    return Discovery::Candidate{
        config, std::get<Discovery::Versions>(std::move(result)), std::string{ homeServerUrl }, std::move(spClient) };
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::StrategyResult local::ProbeRedirect(
    IClientFactory& factory, Configuration::ServerConnectionConfig const& config, std::string_view homeServerUrl)
{
    auto result = Probe(factory, config, homeServerUrl);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }
    return std::get<Discovery::Candidate>(std::move(result));
}

//----------------------------------------------------------------------------------------------------------------------
