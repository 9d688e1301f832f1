//----------------------------------------------------------------------------------------------------------------------
// File: SessionParams.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SessionParams.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Credentials = "credentials";
constexpr std::string_view Config = "config";
constexpr std::string_view TokenValid = "token_valid";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Session::CreateSessionId(std::string_view userId, std::string_view deviceId)
{
    std::string identifier;
    identifier.reserve(userId.size() + IdentifierSeperator.size() + deviceId.size());
    identifier.append(userId).append(IdentifierSeperator).append(deviceId);
    return identifier;
}

//----------------------------------------------------------------------------------------------------------------------

Session::Params::Params(
    Authentication::Credentials const& credentials,
    Configuration::ServerConnectionConfig const& config,
    bool isTokenValid)
    : m_sessionId(CreateSessionId(credentials.userId, credentials.deviceId))
    , m_credentials(credentials)
    , m_config(config)
    , m_isTokenValid(isTokenValid)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Session::Params::GetSessionId() const { return m_sessionId; }

//----------------------------------------------------------------------------------------------------------------------

Authentication::Credentials const& Session::Params::GetCredentials() const { return m_credentials; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig const& Session::Params::GetConnectionConfig() const { return m_config; }

//----------------------------------------------------------------------------------------------------------------------

bool Session::Params::IsTokenValid() const { return m_isTokenValid; }

//----------------------------------------------------------------------------------------------------------------------

boost::json::value Session::Params::Write() const
{
    return boost::json::object{
        { symbols::Credentials, m_credentials.Write() },
        { symbols::Config, m_config.Write() },
        { symbols::TokenValid, m_isTokenValid },
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Session::Params> Session::Params::Read(boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    auto const credentials = pObject->find(symbols::Credentials);
    auto const config = pObject->find(symbols::Config);
    if (credentials == pObject->end() || config == pObject->end()) { return {}; }

    auto const optCredentials = Authentication::Credentials::Read(credentials->value());
    auto const optConfig = Configuration::ServerConnectionConfig::Read(config->value());
    if (!optCredentials || !optConfig) { return {}; }

    bool isTokenValid = true;
    if (auto const itr = pObject->find(symbols::TokenValid); itr != pObject->end()) {
        if (!itr->value().is_bool()) { return {}; }
        isTokenValid = itr->value().get_bool();
    }

    return Params{ *optCredentials, *optConfig, isTokenValid };
}

//----------------------------------------------------------------------------------------------------------------------
