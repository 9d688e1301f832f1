//----------------------------------------------------------------------------------------------------------------------
// File: Documents.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Documents.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> ReadBaseUrl(boost::json::object const& json, std::string_view key);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view DefaultHomeServerUrl = "default_hs_url";
constexpr std::string_view HomeServer = "m.homeserver";
constexpr std::string_view IdentityServer = "m.identity_server";
constexpr std::string_view BaseUrl = "base_url";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::LegacyConfig> Discovery::LegacyConfig::Read(boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    LegacyConfig config;
    if (auto const itr = pObject->find(symbols::DefaultHomeServerUrl); itr != pObject->end() && itr->value().is_string()) {
        config.defaultHomeServerUrl = std::string{ itr->value().get_string() };
    }
    return config;
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::LegacyConfig::HasDefaultHomeServer() const
{
    if (!defaultHomeServerUrl) { return false; }
    return !std::ranges::all_of(*defaultHomeServerUrl, [] (char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::ClientWellKnown> Discovery::ClientWellKnown::Read(boost::json::value const& json)
{
    // JSON Schema:
    // {
    //     "m.homeserver": { "base_url": String },
    //     "m.identity_server": Optional { "base_url": String }
    // }
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    return ClientWellKnown{
        .homeServerBaseUrl = local::ReadBaseUrl(*pObject, symbols::HomeServer),
        .identityServerBaseUrl = local::ReadBaseUrl(*pObject, symbols::IdentityServer)
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::ReadBaseUrl(boost::json::object const& json, std::string_view key)
{
    auto const server = json.find(key);
    if (server == json.end() || !server->value().is_object()) { return {}; }

    auto const& object = server->value().get_object();
    if (auto const itr = object.find(symbols::BaseUrl); itr != object.end() && itr->value().is_string()) {
        return std::string{ itr->value().get_string() };
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
