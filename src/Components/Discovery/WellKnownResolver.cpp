//----------------------------------------------------------------------------------------------------------------------
// File: WellKnownResolver.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "WellKnownResolver.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Network/Uri.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string TrimTrailingSeperators(std::string_view url);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Discovery::WellKnownResolver::WellKnownResolver(std::shared_ptr<IClientFactory> const& spClientFactory)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spClientFactory(spClientFactory)
{
    assert(m_logger);
    assert(m_spClientFactory);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Discovery::WellKnownResolver::GetDomain(std::string_view matrixId)
{
    // A user identifier has the form "@localpart:domain", the domain may include a port. 
    if (matrixId.size() < 4 || matrixId.front() != '@') { return {}; }

    auto const seperator = matrixId.find(':');
    if (seperator == std::string_view::npos || seperator == 1 || seperator + 1 == matrixId.size()) { return {}; }

    return std::string{ matrixId.substr(seperator + 1) };
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::WellKnownResult> Discovery::WellKnownResolver::Resolve(
    std::string_view matrixId, std::optional<Configuration::ServerConnectionConfig> const& optConfig)
{
    auto const optDomain = GetDomain(matrixId);
    if (!optDomain) { return WellKnownResult{ WellKnown::InvalidMatrixId{} }; }

    std::string const domainUrl = std::string{ Network::SecureScheme } + std::string{ Network::SchemeSeperator } + *optDomain;

    // The lookup honors the transport options of the caller's configuration, but is always sent to the domain.  
    auto const config = [&] () -> std::optional<Configuration::ServerConnectionConfig> {
        if (optConfig) { return optConfig->WithHomeServerUri(domainUrl); }
        return Configuration::ServerConnectionConfig::Builder{}.SetHomeServerUri(domainUrl).Build();
    }();
    if (!config) { return WellKnownResult{ WellKnown::InvalidMatrixId{} }; }

    Api::Client const client{ m_spClientFactory->BuildClient(*config), config->GetHomeServerUri() };
    auto const result = client.FetchWellKnown();

    if (auto const* const pReason = Failure::GetReason(result); pReason) {
        return std::visit(VariantVisitor{
            [] (Failure::UnrecognizedCertificate const& failure) -> Failure::Expected<WellKnownResult> {
                return Failure::Reason{ failure };
            },
            [] (Failure::Transport const&) -> Failure::Expected<WellKnownResult> {
                return WellKnownResult{ WellKnown::Ignore{} };
            },
            [] (Failure::ServerError const& failure) -> Failure::Expected<WellKnownResult> {
                if (failure.code == Network::Http::Status::NotFound) { return WellKnownResult{ WellKnown::Ignore{} }; }
                return WellKnownResult{ WellKnown::FailPrompt{} };
            },
            [] (auto const&) -> Failure::Expected<WellKnownResult> { return WellKnownResult{ WellKnown::FailPrompt{} }; }
        }, *pReason);
    }

    return Validate(std::get<ClientWellKnown>(result), *config);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::WellKnownResult Discovery::WellKnownResolver::Validate(
    ClientWellKnown const& document, Configuration::ServerConnectionConfig const& config) const
{
    if (!document.homeServerBaseUrl || document.homeServerBaseUrl->empty()) {
        m_logger->debug("The discovery document does not provide a homeserver.");
        return WellKnown::FailPrompt{};
    }

    auto const homeServerUrl = local::TrimTrailingSeperators(*document.homeServerBaseUrl);
    if (!Network::Uri::Parse(homeServerUrl).IsRoutable()) {
        m_logger->debug("The discovery document provided an invalid homeserver: {}.", homeServerUrl);
        return WellKnown::FailError{};
    }

    {
        auto const homeServerConfig = config.WithHomeServerUri(homeServerUrl);
        Api::Client const client{ m_spClientFactory->BuildClient(homeServerConfig), homeServerConfig.GetHomeServerUri() };
        if (!Failure::HasValue(client.FetchVersions())) {
            m_logger->debug("The homeserver advertised by the discovery document is unreachable: {}.", homeServerUrl);
            return WellKnown::FailError{};
        }
    }

    if (!document.identityServerBaseUrl) { return WellKnown::Prompt{ homeServerUrl, {} }; }

    auto const identityServerUrl = local::TrimTrailingSeperators(*document.identityServerBaseUrl);
    if (identityServerUrl.empty() || !Network::Uri::Parse(identityServerUrl).IsRoutable()) {
        m_logger->debug("The discovery document provided an invalid identity server.");
        return WellKnown::FailError{};
    }

    auto const identityServerConfig = config.WithHomeServerUri(identityServerUrl);
    Api::Client const client{ m_spClientFactory->BuildClient(identityServerConfig), identityServerConfig.GetHomeServerUri() };
    if (!Failure::HasValue(client.PingIdentityServer())) {
        m_logger->debug("The identity server advertised by the discovery document is unreachable: {}.", identityServerUrl);
        return WellKnown::FailError{};
    }

    return WellKnown::Prompt{ homeServerUrl, identityServerUrl };
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::TrimTrailingSeperators(std::string_view url)
{
    while (!url.empty() && url.back() == '/') { url.remove_suffix(1); }
    return std::string{ url };
}

//----------------------------------------------------------------------------------------------------------------------
