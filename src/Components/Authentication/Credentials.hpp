//----------------------------------------------------------------------------------------------------------------------
// File: Credentials.hpp
// Description: The credentials issued by a homeserver after a successful login or registration.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

struct DiscoveryInformation;
struct Credentials;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

// The optional "well_known" object a server attaches to a login response. When provided, its addresses take 
// precedence over the ones used to log in. 
struct Authentication::DiscoveryInformation
{
    [[nodiscard]] bool operator==(DiscoveryInformation const& other) const = default;

    std::optional<std::string> homeServerUrl;
    std::optional<std::string> identityServerUrl;
};

//----------------------------------------------------------------------------------------------------------------------

struct Authentication::Credentials
{
    [[nodiscard]] bool operator==(Credentials const& other) const = default;

    [[nodiscard]] boost::json::value Write() const;
    [[nodiscard]] static std::optional<Credentials> Read(boost::json::value const& json);

    std::string userId;
    std::string accessToken;
    std::optional<std::string> refreshToken;
    std::string homeServer;
    std::string deviceId;
    std::optional<DiscoveryInformation> discoveryInformation;
};

//----------------------------------------------------------------------------------------------------------------------
