//----------------------------------------------------------------------------------------------------------------------
// File: ServerConnectionConfig.hpp
// Description: The immutable description of how to reach a homeserver. Discovery never mutates a configuration, each
// redirect produces a new value. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Fingerprint.hpp"
#include "Components/Network/Uri.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class ServerConnectionConfig;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::ServerConnectionConfig
{
public:
    class Builder;

    using Fingerprints = std::vector<Fingerprint>;
    using Tokens = std::vector<std::string>;

    [[nodiscard]] bool operator==(ServerConnectionConfig const& other) const = default;

    [[nodiscard]] Network::Uri const& GetHomeServerUri() const;
    [[nodiscard]] std::optional<Network::Uri> const& GetIdentityServerUri() const;
    [[nodiscard]] Fingerprints const& GetAllowedFingerprints() const;
    [[nodiscard]] bool ShouldPin() const;
    [[nodiscard]] Tokens const& GetTlsVersions() const;
    [[nodiscard]] Tokens const& GetTlsCipherSuites() const;
    [[nodiscard]] bool ShouldAcceptTlsExtensions() const;
    [[nodiscard]] bool ForceUsageOfTlsVersions() const;

    [[nodiscard]] bool IsTrusted(Fingerprint const& fingerprint) const;

    [[nodiscard]] ServerConnectionConfig WithHomeServerUri(std::string_view uri) const;
    [[nodiscard]] ServerConnectionConfig WithIdentityServerUri(std::optional<std::string_view> const& optUri) const;
    [[nodiscard]] ServerConnectionConfig WithAllowedFingerprint(Fingerprint const& fingerprint) const;

    [[nodiscard]] boost::json::value Write() const;
    [[nodiscard]] static std::optional<ServerConnectionConfig> Read(boost::json::value const& json);

private:
    ServerConnectionConfig();

    Network::Uri m_homeServerUri;
    std::optional<Network::Uri> m_optIdentityServerUri;
    Fingerprints m_allowedFingerprints;
    bool m_shouldPin;
    Tokens m_tlsVersions;
    Tokens m_tlsCipherSuites;
    bool m_shouldAcceptTlsExtensions;
    bool m_forceUsageTlsVersions;
};

//----------------------------------------------------------------------------------------------------------------------

class Configuration::ServerConnectionConfig::Builder
{
public:
    Builder();

    Builder& SetHomeServerUri(std::string_view uri);
    Builder& SetIdentityServerUri(std::string_view uri);
    Builder& AddAllowedFingerprint(Fingerprint const& fingerprint);
    Builder& SetPinning(bool shouldPin);
    Builder& AddTlsVersion(std::string_view version);
    Builder& AddTlsCipherSuite(std::string_view suite);
    Builder& SetAcceptTlsExtensions(bool accept);
    Builder& SetForceUsageOfTlsVersions(bool force);

    // Note: A configuration requires a home server address. Pinning without any allowed fingerprint would reject 
    // every server, so that combination is also refused. 
    [[nodiscard]] std::optional<ServerConnectionConfig> Build() const;

private:
    ServerConnectionConfig m_config;
    bool m_hasHomeServer;
};

//----------------------------------------------------------------------------------------------------------------------
