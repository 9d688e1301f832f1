//----------------------------------------------------------------------------------------------------------------------
// File: Client.hpp
// Description: Request and response marshalling for the unauthenticated surface of the client-server API. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Authentication/Credentials.hpp"
#include "Components/Authentication/Registration.hpp"
#include "Components/Discovery/Documents.hpp"
#include "Components/Discovery/Versions.hpp"
#include "Components/Failure/Failure.hpp"
#include "Components/Network/Http.hpp"
#include "Components/Network/Uri.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IHttpClient;

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Api {
//----------------------------------------------------------------------------------------------------------------------

class Client;

// A registration request either completes with credentials or asks for further authentication stages. 
using RegistrationResponse = std::variant<Authentication::Credentials, Authentication::FlowResponse>;

namespace Endpoints {
    constexpr std::string_view Versions = "_matrix/client/versions";
    constexpr std::string_view Login = "_matrix/client/r0/login";
    constexpr std::string_view Register = "_matrix/client/r0/register";
    constexpr std::string_view LegacyConfig = "config.json";
    constexpr std::string_view WellKnown = ".well-known/matrix/client";
    constexpr std::string_view IdentityServer = "_matrix/identity/api/v1";
}

//----------------------------------------------------------------------------------------------------------------------
} // Api namespace
//----------------------------------------------------------------------------------------------------------------------

class Api::Client
{
public:
    Client(std::shared_ptr<IHttpClient> const& spHttpClient, Network::Uri const& baseUri);

    [[nodiscard]] Network::Uri const& GetBaseUri() const;

    [[nodiscard]] Failure::Expected<Discovery::Versions> FetchVersions() const;
    [[nodiscard]] Failure::Expected<std::vector<std::string>> FetchLoginFlows() const;
    [[nodiscard]] Failure::Expected<Discovery::LegacyConfig> FetchLegacyConfig() const;
    [[nodiscard]] Failure::Expected<Discovery::ClientWellKnown> FetchWellKnown() const;
    [[nodiscard]] Failure::Status PingIdentityServer() const;

    [[nodiscard]] Failure::Expected<Authentication::Credentials> Login(boost::json::object const& body) const;
    [[nodiscard]] Failure::Expected<RegistrationResponse> Register(boost::json::object const& body) const;

private:
    [[nodiscard]] Failure::Expected<Network::Http::Response> Send(
        Network::Http::Method method, std::string_view path, std::optional<boost::json::object> const& optBody) const;

    // Issues the request and decodes a successful response body. Non-successful statuses become server errors. 
    [[nodiscard]] Failure::Expected<boost::json::value> Fetch(
        Network::Http::Method method,
        std::string_view path,
        std::optional<boost::json::object> const& optBody = {}) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IHttpClient> m_spHttpClient;
    Network::Uri m_baseUri;
};

//----------------------------------------------------------------------------------------------------------------------
