//----------------------------------------------------------------------------------------------------------------------
// File: ServerConnectionConfig.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] boost::json::array WriteTokens(Configuration::ServerConnectionConfig::Tokens const& tokens);
[[nodiscard]] bool ReadTokens(boost::json::object const& json, std::string_view key, Configuration::ServerConnectionConfig::Builder& builder, bool versions);
[[nodiscard]] std::optional<bool> ReadFlag(boost::json::object const& json, std::string_view key);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view HomeServerUri = "home_server_uri";
constexpr std::string_view IdentityServerUri = "identity_server_uri";
constexpr std::string_view AllowedFingerprints = "allowed_fingerprints";
constexpr std::string_view ShouldPin = "should_pin";
constexpr std::string_view TlsVersions = "tls_versions";
constexpr std::string_view TlsCipherSuites = "tls_cipher_suites";
constexpr std::string_view AcceptTlsExtensions = "accept_tls_extensions";
constexpr std::string_view ForceTlsVersions = "force_tls_versions";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. 
//----------------------------------------------------------------------------------------------------------------------
// {
//     "home_server_uri": String,
//     "identity_server_uri": Optional String,
//     "allowed_fingerprints": [{ "digest": String, "hash_type": String }],
//     "should_pin": Boolean,
//     "tls_versions": [String],
//     "tls_cipher_suites": [String],
//     "accept_tls_extensions": Boolean,
//     "force_tls_versions": Boolean
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::ServerConnectionConfig()
    : m_homeServerUri()
    , m_optIdentityServerUri()
    , m_allowedFingerprints()
    , m_shouldPin(false)
    , m_tlsVersions()
    , m_tlsCipherSuites()
    , m_shouldAcceptTlsExtensions(true)
    , m_forceUsageTlsVersions(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::Uri const& Configuration::ServerConnectionConfig::GetHomeServerUri() const { return m_homeServerUri; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Network::Uri> const& Configuration::ServerConnectionConfig::GetIdentityServerUri() const
{
    return m_optIdentityServerUri;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Fingerprints const& Configuration::ServerConnectionConfig::GetAllowedFingerprints() const
{
    return m_allowedFingerprints;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ServerConnectionConfig::ShouldPin() const { return m_shouldPin; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Tokens const& Configuration::ServerConnectionConfig::GetTlsVersions() const
{
    return m_tlsVersions;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Tokens const& Configuration::ServerConnectionConfig::GetTlsCipherSuites() const
{
    return m_tlsCipherSuites;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ServerConnectionConfig::ShouldAcceptTlsExtensions() const { return m_shouldAcceptTlsExtensions; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ServerConnectionConfig::ForceUsageOfTlsVersions() const { return m_forceUsageTlsVersions; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ServerConnectionConfig::IsTrusted(Fingerprint const& fingerprint) const
{
    return std::ranges::find(m_allowedFingerprints, fingerprint) != m_allowedFingerprints.end();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig Configuration::ServerConnectionConfig::WithHomeServerUri(std::string_view uri) const
{
    ServerConnectionConfig copy = *this;
    copy.m_homeServerUri = Network::Uri::Parse(uri);
    return copy;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig Configuration::ServerConnectionConfig::WithIdentityServerUri(
    std::optional<std::string_view> const& optUri) const
{
    ServerConnectionConfig copy = *this;
    if (optUri && !optUri->empty()) {
        copy.m_optIdentityServerUri = Network::Uri::Parse(*optUri);
    } else {
        copy.m_optIdentityServerUri.reset();
    }
    return copy;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig Configuration::ServerConnectionConfig::WithAllowedFingerprint(
    Fingerprint const& fingerprint) const
{
    ServerConnectionConfig copy = *this;
    if (!copy.IsTrusted(fingerprint)) { copy.m_allowedFingerprints.emplace_back(fingerprint); }
    return copy;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::value Configuration::ServerConnectionConfig::Write() const
{
    boost::json::object json;
    json[symbols::HomeServerUri] = m_homeServerUri.ToString();
    if (m_optIdentityServerUri) { json[symbols::IdentityServerUri] = m_optIdentityServerUri->ToString(); }

    boost::json::array fingerprints;
    std::ranges::for_each(m_allowedFingerprints, [&fingerprints] (Fingerprint const& fingerprint) {
        fingerprints.emplace_back(fingerprint.Write());
    });
    json[symbols::AllowedFingerprints] = std::move(fingerprints);

    json[symbols::ShouldPin] = m_shouldPin;
    json[symbols::TlsVersions] = local::WriteTokens(m_tlsVersions);
    json[symbols::TlsCipherSuites] = local::WriteTokens(m_tlsCipherSuites);
    json[symbols::AcceptTlsExtensions] = m_shouldAcceptTlsExtensions;
    json[symbols::ForceTlsVersions] = m_forceUsageTlsVersions;
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::ServerConnectionConfig> Configuration::ServerConnectionConfig::Read(
    boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    Builder builder;

    auto const* const pHomeServer = pObject->if_contains(symbols::HomeServerUri);
    if (!pHomeServer || !pHomeServer->is_string()) { return {}; }
    builder.SetHomeServerUri(pHomeServer->get_string());

    if (auto const* const pIdentityServer = pObject->if_contains(symbols::IdentityServerUri); pIdentityServer) {
        if (!pIdentityServer->is_string()) { return {}; }
        builder.SetIdentityServerUri(pIdentityServer->get_string());
    }

    if (auto const* const pFingerprints = pObject->if_contains(symbols::AllowedFingerprints); pFingerprints) {
        if (!pFingerprints->is_array()) { return {}; }
        for (auto const& entry : pFingerprints->get_array()) {
            auto const optFingerprint = Fingerprint::Read(entry);
            if (!optFingerprint) { return {}; }
            builder.AddAllowedFingerprint(*optFingerprint);
        }
    }

    if (!local::ReadTokens(*pObject, symbols::TlsVersions, builder, true)) { return {}; }
    if (!local::ReadTokens(*pObject, symbols::TlsCipherSuites, builder, false)) { return {}; }

    if (auto const optPin = local::ReadFlag(*pObject, symbols::ShouldPin); optPin) { builder.SetPinning(*optPin); }
    if (auto const optAccept = local::ReadFlag(*pObject, symbols::AcceptTlsExtensions); optAccept) {
        builder.SetAcceptTlsExtensions(*optAccept);
    }
    if (auto const optForce = local::ReadFlag(*pObject, symbols::ForceTlsVersions); optForce) {
        builder.SetForceUsageOfTlsVersions(*optForce);
    }

    return builder.Build();
}

//----------------------------------------------------------------------------------------------------------------------
// Configuration::ServerConnectionConfig::Builder {
//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder::Builder()
    : m_config()
    , m_hasHomeServer(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::SetHomeServerUri(
    std::string_view uri)
{
    m_config.m_homeServerUri = Network::Uri::Parse(uri);
    m_hasHomeServer = !uri.empty();
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::SetIdentityServerUri(
    std::string_view uri)
{
    if (uri.empty()) { m_config.m_optIdentityServerUri.reset(); } 
    else { m_config.m_optIdentityServerUri = Network::Uri::Parse(uri); }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::AddAllowedFingerprint(
    Fingerprint const& fingerprint)
{
    if (!m_config.IsTrusted(fingerprint)) { m_config.m_allowedFingerprints.emplace_back(fingerprint); }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::SetPinning(bool shouldPin)
{
    m_config.m_shouldPin = shouldPin;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::AddTlsVersion(
    std::string_view version)
{
    m_config.m_tlsVersions.emplace_back(version);
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::AddTlsCipherSuite(
    std::string_view suite)
{
    m_config.m_tlsCipherSuites.emplace_back(suite);
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::SetAcceptTlsExtensions(
    bool accept)
{
    m_config.m_shouldAcceptTlsExtensions = accept;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig::Builder& Configuration::ServerConnectionConfig::Builder::SetForceUsageOfTlsVersions(
    bool force)
{
    m_config.m_forceUsageTlsVersions = force;
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::ServerConnectionConfig> Configuration::ServerConnectionConfig::Builder::Build() const
{
    if (!m_hasHomeServer) { return {}; }
    if (m_config.m_shouldPin && m_config.m_allowedFingerprints.empty()) { return {}; }
    return m_config;
}

//----------------------------------------------------------------------------------------------------------------------
// } Configuration::ServerConnectionConfig::Builder
//----------------------------------------------------------------------------------------------------------------------

boost::json::array local::WriteTokens(Configuration::ServerConnectionConfig::Tokens const& tokens)
{
    boost::json::array json;
    std::ranges::for_each(tokens, [&json] (std::string const& token) { json.emplace_back(token); });
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::ReadTokens(
    boost::json::object const& json,
    std::string_view key,
    Configuration::ServerConnectionConfig::Builder& builder,
    bool versions)
{
    auto const* const pTokens = json.if_contains(key);
    if (!pTokens) { return true; } // The token lists are optional. 
    if (!pTokens->is_array()) { return false; }

    for (auto const& token : pTokens->get_array()) {
        if (!token.is_string()) { return false; }
        if (versions) { builder.AddTlsVersion(token.get_string()); }
        else { builder.AddTlsCipherSuite(token.get_string()); }
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<bool> local::ReadFlag(boost::json::object const& json, std::string_view key)
{
    if (auto const* const pFlag = json.if_contains(key); pFlag && pFlag->is_bool()) { return pFlag->get_bool(); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
