//----------------------------------------------------------------------------------------------------------------------
// File: Documents.hpp
// Description: The client configuration documents fetched while searching for a homeserver. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

struct LegacyConfig;
struct ClientWellKnown;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

// The "config.json" served alongside a web client deployment. Only the default homeserver is of interest. 
struct Discovery::LegacyConfig
{
    // Returns an empty optional when the document is not a JSON object. A missing or mistyped default homeserver is
    // not an error, the field is left empty. 
    [[nodiscard]] static std::optional<LegacyConfig> Read(boost::json::value const& json);

    [[nodiscard]] bool HasDefaultHomeServer() const;

    std::optional<std::string> defaultHomeServerUrl;
};

//----------------------------------------------------------------------------------------------------------------------

// The "/.well-known/matrix/client" document published by a domain. 
struct Discovery::ClientWellKnown
{
    [[nodiscard]] static std::optional<ClientWellKnown> Read(boost::json::value const& json);

    std::optional<std::string> homeServerBaseUrl;
    std::optional<std::string> identityServerBaseUrl;
};

//----------------------------------------------------------------------------------------------------------------------
