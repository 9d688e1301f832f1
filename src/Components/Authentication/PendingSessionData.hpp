//----------------------------------------------------------------------------------------------------------------------
// File: PendingSessionData.hpp
// Description: The server configuration produced by a successful discovery that does not yet have credentials, along
// with the state of any login or registration in progress against it. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/value.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class PendingSessionData;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

class Authentication::PendingSessionData
{
public:
    static constexpr std::size_t ClientSecretSize = 16; // The number of random bytes, the secret is hex encoded. 

    // Creates a record for the configuration with a fresh client secret and no progress. 
    explicit PendingSessionData(Configuration::ServerConnectionConfig const& config);

    [[nodiscard]] bool operator==(PendingSessionData const& other) const = default;

    [[nodiscard]] Configuration::ServerConnectionConfig const& GetConnectionConfig() const;
    [[nodiscard]] std::string const& GetClientSecret() const;
    [[nodiscard]] std::uint32_t GetSendAttempt() const;
    [[nodiscard]] std::optional<std::string> const& GetCurrentSession() const;
    [[nodiscard]] bool IsRegistrationStarted() const;

    void SetCurrentSession(std::optional<std::string> const& optSession);
    void SetRegistrationStarted(bool started);
    std::uint32_t IncrementSendAttempt();

    // Discards the progress of any login or registration, keeping only the server configuration. 
    [[nodiscard]] PendingSessionData Demote() const;

    [[nodiscard]] boost::json::value Write() const;
    [[nodiscard]] static std::optional<PendingSessionData> Read(boost::json::value const& json);

private:
    PendingSessionData(Configuration::ServerConnectionConfig const& config, std::string clientSecret);

    Configuration::ServerConnectionConfig m_config;
    std::string m_clientSecret;
    std::uint32_t m_sendAttempt;
    std::optional<std::string> m_optCurrentSession;
    bool m_isRegistrationStarted;
};

//----------------------------------------------------------------------------------------------------------------------
