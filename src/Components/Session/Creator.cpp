//----------------------------------------------------------------------------------------------------------------------
// File: Creator.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Creator.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Network/Uri.hpp"
#include "Interfaces/Session.hpp"
#include "Interfaces/SessionManager.hpp"
#include "Interfaces/SessionStore.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> GetOverride(std::optional<std::string> const& optUrl);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Session::Creator::Creator(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spSessionStore(spServiceProvider->Require<ISessionStore>())
    , m_spSessionManager(spServiceProvider->Require<ISessionManager>())
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<ISession> Session::Creator::CreateSession(
    Authentication::Credentials const& credentials, Configuration::ServerConnectionConfig const& config) const
{
    Params const params{ credentials, ApplyDiscoveryInformation(credentials, config), true };
    m_logger->info("Creating a session for {}.", params.GetSessionId());

    if (auto const status = m_spSessionStore->Save(params); status != Configuration::StatusCode::Success) {
        m_logger->error(
            "Failed to store the parameters of session {}! Reason: {}",
            params.GetSessionId(), Configuration::StatusCodeToString(status));
    }

    return m_spSessionManager->GetOrCreateSession(params);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig Session::Creator::ApplyDiscoveryInformation(
    Authentication::Credentials const& credentials, Configuration::ServerConnectionConfig const& config)
{
    auto const& optDiscovery = credentials.discoveryInformation;
    if (!optDiscovery) { return config; }

    auto updated = config;
    if (auto const optUrl = local::GetOverride(optDiscovery->homeServerUrl); optUrl) {
        updated = updated.WithHomeServerUri(*optUrl);
    }

    if (auto const optUrl = local::GetOverride(optDiscovery->identityServerUrl); optUrl) {
        updated = updated.WithIdentityServerUri(std::string_view{ *optUrl });
    }

    return updated;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::GetOverride(std::optional<std::string> const& optUrl)
{
    if (!optUrl) { return {}; }

    std::string_view url = *optUrl;
    while (!url.empty() && url.back() == '/') { url.remove_suffix(1); }

    // Only an address that could be routed is allowed to replace the one that was used to authenticate. 
    if (!Network::Uri::Parse(url).IsRoutable()) { return {}; }
    return std::string{ url };
}

//----------------------------------------------------------------------------------------------------------------------
