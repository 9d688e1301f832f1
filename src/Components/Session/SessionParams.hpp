//----------------------------------------------------------------------------------------------------------------------
// File: SessionParams.hpp
// Description: The persisted record of an authenticated session. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Authentication/Credentials.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Session {
//----------------------------------------------------------------------------------------------------------------------

class Params;

constexpr std::string_view IdentifierSeperator = "|";

[[nodiscard]] std::string CreateSessionId(std::string_view userId, std::string_view deviceId);

//----------------------------------------------------------------------------------------------------------------------
} // Session namespace
//----------------------------------------------------------------------------------------------------------------------

class Session::Params
{
public:
    Params(
        Authentication::Credentials const& credentials,
        Configuration::ServerConnectionConfig const& config,
        bool isTokenValid);

    [[nodiscard]] bool operator==(Params const& other) const = default;

    [[nodiscard]] std::string const& GetSessionId() const;
    [[nodiscard]] Authentication::Credentials const& GetCredentials() const;
    [[nodiscard]] Configuration::ServerConnectionConfig const& GetConnectionConfig() const;
    [[nodiscard]] bool IsTokenValid() const;

    [[nodiscard]] boost::json::value Write() const;
    [[nodiscard]] static std::optional<Params> Read(boost::json::value const& json);

private:
    std::string m_sessionId;
    Authentication::Credentials m_credentials;
    Configuration::ServerConnectionConfig m_config;
    bool m_isTokenValid;
};

//----------------------------------------------------------------------------------------------------------------------
