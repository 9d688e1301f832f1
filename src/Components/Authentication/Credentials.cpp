//----------------------------------------------------------------------------------------------------------------------
// File: Credentials.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Credentials.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> ReadString(boost::json::object const& json, std::string_view key);
[[nodiscard]] std::optional<std::string> ReadBaseUrl(boost::json::object const& json, std::string_view key);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view UserId = "user_id";
constexpr std::string_view AccessToken = "access_token";
constexpr std::string_view RefreshToken = "refresh_token";
constexpr std::string_view HomeServer = "home_server";
constexpr std::string_view DeviceId = "device_id";
constexpr std::string_view WellKnown = "well_known";
constexpr std::string_view HomeServerInformation = "m.homeserver";
constexpr std::string_view IdentityServerInformation = "m.identity_server";
constexpr std::string_view BaseUrl = "base_url";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

boost::json::value Authentication::Credentials::Write() const
{
    boost::json::object json;
    json[symbols::UserId] = userId;
    json[symbols::AccessToken] = accessToken;
    if (refreshToken) { json[symbols::RefreshToken] = *refreshToken; }
    json[symbols::HomeServer] = homeServer;
    json[symbols::DeviceId] = deviceId;

    if (discoveryInformation) {
        boost::json::object wellKnown;
        if (auto const& optUrl = discoveryInformation->homeServerUrl; optUrl) {
            wellKnown[symbols::HomeServerInformation] = { { symbols::BaseUrl, *optUrl } };
        }
        if (auto const& optUrl = discoveryInformation->identityServerUrl; optUrl) {
            wellKnown[symbols::IdentityServerInformation] = { { symbols::BaseUrl, *optUrl } };
        }
        json[symbols::WellKnown] = std::move(wellKnown);
    }

    return json;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Authentication::Credentials> Authentication::Credentials::Read(boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    // The user and access token identify the session, a response without them is unusable. The remaining fields are 
    // optional in older server implementations. 
    auto optUserId = local::ReadString(*pObject, symbols::UserId);
    auto optAccessToken = local::ReadString(*pObject, symbols::AccessToken);
    if (!optUserId || optUserId->empty() || !optAccessToken || optAccessToken->empty()) { return {}; }

    Credentials credentials;
    credentials.userId = std::move(*optUserId);
    credentials.accessToken = std::move(*optAccessToken);
    credentials.refreshToken = local::ReadString(*pObject, symbols::RefreshToken);
    credentials.homeServer = local::ReadString(*pObject, symbols::HomeServer).value_or("");
    credentials.deviceId = local::ReadString(*pObject, symbols::DeviceId).value_or("");

    if (auto const itr = pObject->find(symbols::WellKnown); itr != pObject->end() && itr->value().is_object()) {
        auto const& wellKnown = itr->value().get_object();
        credentials.discoveryInformation = DiscoveryInformation{
            .homeServerUrl = local::ReadBaseUrl(wellKnown, symbols::HomeServerInformation),
            .identityServerUrl = local::ReadBaseUrl(wellKnown, symbols::IdentityServerInformation)
        };
    }

    return credentials;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::ReadString(boost::json::object const& json, std::string_view key)
{
    if (auto const itr = json.find(key); itr != json.end() && itr->value().is_string()) {
        return std::string{ itr->value().get_string() };
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::ReadBaseUrl(boost::json::object const& json, std::string_view key)
{
    if (auto const itr = json.find(key); itr != json.end() && itr->value().is_object()) {
        return ReadString(itr->value().get_object(), symbols::BaseUrl);
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
