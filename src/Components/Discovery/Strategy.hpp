//----------------------------------------------------------------------------------------------------------------------
// File: Strategy.hpp
// Description: The strategies used to locate a homeserver from a user supplied address. Each strategy either 
// resolves a candidate server, reports that it found nothing, or fails outright. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Versions.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Failure/Failure.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;
class IWellKnownResolver;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

// A server that answered a versions probe. The client remains bound to the candidate's configuration such that the 
// login flows can be fetched with the same transport. 
struct Candidate
{
    Configuration::ServerConnectionConfig config;
    Versions versions;
    std::string homeServerUrl;
    std::shared_ptr<Api::Client> spClient;
};

struct NotFound {};

using StrategyResult = std::variant<Candidate, NotFound, Failure::Reason>;

class IStrategy;
class DirectStrategy;
class LegacyConfigStrategy;
class WellKnownStrategy;

// The name of the user used to query a domain's discovery document. Only the domain is significant. 
constexpr std::string_view WellKnownProbeUser = "@alice:";

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::IStrategy
{
public:
    virtual ~IStrategy() = default;

    [[nodiscard]] virtual std::string_view GetName() const = 0;
    [[nodiscard]] virtual StrategyResult Attempt(Configuration::ServerConnectionConfig const& config) const = 0;
};

//----------------------------------------------------------------------------------------------------------------------

// Probes the supplied address as is. Only an HTTP 404 is reported as not found. 
class Discovery::DirectStrategy final : public Discovery::IStrategy
{
public:
    static constexpr std::string_view Name = "direct";

    explicit DirectStrategy(std::shared_ptr<IClientFactory> const& spClientFactory);

    // IStrategy {
    [[nodiscard]] virtual std::string_view GetName() const override;
    [[nodiscard]] virtual StrategyResult Attempt(Configuration::ServerConnectionConfig const& config) const override;
    // } IStrategy

private:
    std::shared_ptr<IClientFactory> m_spClientFactory;
};

//----------------------------------------------------------------------------------------------------------------------

// Treats the supplied address as a web client deployment and follows the default homeserver of its configuration.
class Discovery::LegacyConfigStrategy final : public Discovery::IStrategy
{
public:
    static constexpr std::string_view Name = "legacy-config";

    explicit LegacyConfigStrategy(std::shared_ptr<IClientFactory> const& spClientFactory);

    // IStrategy {
    [[nodiscard]] virtual std::string_view GetName() const override;
    [[nodiscard]] virtual StrategyResult Attempt(Configuration::ServerConnectionConfig const& config) const override;
    // } IStrategy

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IClientFactory> m_spClientFactory;
};

//----------------------------------------------------------------------------------------------------------------------

// Looks up the discovery document published by the domain of the supplied address. This is the final strategy, it 
// never reports not found. A domain without a usable document fails with an HTTP 404. 
class Discovery::WellKnownStrategy final : public Discovery::IStrategy
{
public:
    static constexpr std::string_view Name = "well-known";

    WellKnownStrategy(
        std::shared_ptr<IClientFactory> const& spClientFactory,
        std::shared_ptr<IWellKnownResolver> const& spResolver);

    // IStrategy {
    [[nodiscard]] virtual std::string_view GetName() const override;
    [[nodiscard]] virtual StrategyResult Attempt(Configuration::ServerConnectionConfig const& config) const override;
    // } IStrategy

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IClientFactory> m_spClientFactory;
    std::shared_ptr<IWellKnownResolver> m_spResolver;
};

//----------------------------------------------------------------------------------------------------------------------
