//----------------------------------------------------------------------------------------------------------------------
// File: Client.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Client.hpp"
#include "Interfaces/HttpClient.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<boost::json::value> Parse(std::string_view body);
[[nodiscard]] Failure::ServerError ToServerError(Network::Http::Response const& response);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Flows = "flows";
constexpr std::string_view Type = "type";
constexpr std::string_view ErrorCode = "errcode";
constexpr std::string_view Error = "error";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Api::Client::Client(std::shared_ptr<IHttpClient> const& spHttpClient, Network::Uri const& baseUri)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spHttpClient(spHttpClient)
    , m_baseUri(baseUri)
{
    assert(m_logger);
    assert(m_spHttpClient);
}

//----------------------------------------------------------------------------------------------------------------------

Network::Uri const& Api::Client::GetBaseUri() const { return m_baseUri; }

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::Versions> Api::Client::FetchVersions() const
{
    auto result = Fetch(Network::Http::Method::Get, Endpoints::Versions);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto optVersions = Discovery::Versions::Read(std::get<boost::json::value>(result));
    if (!optVersions) { return Failure::MalformedResponse{ "The versions response has an unexpected shape." }; }
    return std::move(*optVersions);
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<std::vector<std::string>> Api::Client::FetchLoginFlows() const
{
    // JSON Schema:
    // {
    //     "flows": Optional [{ "type": Optional String }]
    // }
    auto result = Fetch(Network::Http::Method::Get, Endpoints::Login);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto const* const pObject = std::get<boost::json::value>(result).if_object();
    if (!pObject) { return Failure::MalformedResponse{ "The login flows response is not an object." }; }

    std::vector<std::string> types;
    auto const flows = pObject->find(symbols::Flows);
    if (flows == pObject->end() || flows->value().is_null()) { return types; }
    if (!flows->value().is_array()) { return Failure::MalformedResponse{ "The login flows are not an array." }; }

    // Flows without a type are skipped, the remaining types are kept in the order advertised by the server. 
    for (auto const& flow : flows->value().get_array()) {
        auto const* const pFlow = flow.if_object();
        if (!pFlow) { continue; }
        if (auto const itr = pFlow->find(symbols::Type); itr != pFlow->end() && itr->value().is_string()) {
            types.emplace_back(itr->value().get_string());
        }
    }

    return types;
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::LegacyConfig> Api::Client::FetchLegacyConfig() const
{
    auto result = Fetch(Network::Http::Method::Get, Endpoints::LegacyConfig);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto optConfig = Discovery::LegacyConfig::Read(std::get<boost::json::value>(result));
    if (!optConfig) { return Failure::MalformedResponse{ "The client configuration is not an object." }; }
    return std::move(*optConfig);
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Discovery::ClientWellKnown> Api::Client::FetchWellKnown() const
{
    auto result = Fetch(Network::Http::Method::Get, Endpoints::WellKnown);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto optWellKnown = Discovery::ClientWellKnown::Read(std::get<boost::json::value>(result));
    if (!optWellKnown) { return Failure::MalformedResponse{ "The discovery document is not an object." }; }
    return std::move(*optWellKnown);
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Status Api::Client::PingIdentityServer() const
{
    // Only the reachability of the identity server matters, the body is not inspected. 
    auto result = Send(Network::Http::Method::Get, Endpoints::IdentityServer, {});
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto const& response = std::get<Network::Http::Response>(result);
    if (!response.IsSuccessful()) { return local::ToServerError(response); }
    return std::monostate{};
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Authentication::Credentials> Api::Client::Login(boost::json::object const& body) const
{
    auto result = Fetch(Network::Http::Method::Post, Endpoints::Login, body);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto optCredentials = Authentication::Credentials::Read(std::get<boost::json::value>(result));
    if (!optCredentials) { return Failure::MalformedResponse{ "The login response is missing the credentials." }; }
    return std::move(*optCredentials);
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Api::RegistrationResponse> Api::Client::Register(boost::json::object const& body) const
{
    auto result = Send(Network::Http::Method::Post, Endpoints::Register, body);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto const& response = std::get<Network::Http::Response>(result);

    // An unauthorized response describing the remaining stages is the expected continuation of a registration. 
    if (response.status == Network::Http::Status::Unauthorized) {
        if (auto const optJson = local::Parse(response.body); optJson) {
            if (auto optFlows = Authentication::FlowResponse::Read(*optJson); optFlows) {
                return RegistrationResponse{ std::move(*optFlows) };
            }
        }
        return local::ToServerError(response);
    }

    if (!response.IsSuccessful()) { return local::ToServerError(response); }

    auto const optJson = local::Parse(response.body);
    if (!optJson) { return Failure::MalformedResponse{ "The registration response is not valid JSON." }; }

    auto optCredentials = Authentication::Credentials::Read(*optJson);
    if (!optCredentials) { return Failure::MalformedResponse{ "The registration response is missing the credentials." }; }
    return RegistrationResponse{ std::move(*optCredentials) };
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<Network::Http::Response> Api::Client::Send(
    Network::Http::Method method, std::string_view path, std::optional<boost::json::object> const& optBody) const
{
    Network::Http::Request request{ method, m_baseUri.Resolve(path), {} };
    if (optBody) { request.body = boost::json::serialize(*optBody); }

    m_logger->debug("Sending {} {}.", Network::Http::MethodToString(method), request.url);
    auto result = m_spHttpClient->Execute(request);
    if (auto const* const pReason = Failure::GetReason(result); pReason) {
        m_logger->debug("The request to {} failed: {}.", request.url, Failure::ToString(*pReason));
    }
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Failure::Expected<boost::json::value> Api::Client::Fetch(
    Network::Http::Method method, std::string_view path, std::optional<boost::json::object> const& optBody) const
{
    auto result = Send(method, path, optBody);
    if (auto const* const pReason = Failure::GetReason(result); pReason) { return *pReason; }

    auto const& response = std::get<Network::Http::Response>(result);
    if (!response.IsSuccessful()) { return local::ToServerError(response); }

    auto optJson = local::Parse(response.body);
    if (!optJson) { return Failure::MalformedResponse{ "The response body is not valid JSON." }; }
    return std::move(*optJson);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::json::value> local::Parse(std::string_view body)
{
    boost::json::error_code error;
    auto json = boost::json::parse(body, error);
    if (error) { return {}; }
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

Failure::ServerError local::ToServerError(Network::Http::Response const& response)
{
    Failure::ServerError error{ response.status, "", "" };

    // Error bodies are best effort, a proxy in front of the server may respond with anything. 
    if (auto const optJson = Parse(response.body); optJson && optJson->is_object()) {
        auto const& object = optJson->get_object();
        if (auto const itr = object.find(symbols::ErrorCode); itr != object.end() && itr->value().is_string()) {
            error.errcode = itr->value().get_string();
        }
        if (auto const itr = object.find(symbols::Error); itr != object.end() && itr->value().is_string()) {
            error.message = itr->value().get_string();
        }
    }

    return error;
}

//----------------------------------------------------------------------------------------------------------------------
