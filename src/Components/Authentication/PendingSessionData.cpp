//----------------------------------------------------------------------------------------------------------------------
// File: PendingSessionData.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PendingSessionData.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <limits>
#include <stdexcept>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string GenerateClientSecret();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Config = "config";
constexpr std::string_view ClientSecret = "client_secret";
constexpr std::string_view SendAttempt = "send_attempt";
constexpr std::string_view CurrentSession = "current_session";
constexpr std::string_view RegistrationStarted = "registration_started";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Authentication::PendingSessionData::PendingSessionData(Configuration::ServerConnectionConfig const& config)
    : PendingSessionData(config, local::GenerateClientSecret())
{
}

//----------------------------------------------------------------------------------------------------------------------

Authentication::PendingSessionData::PendingSessionData(
    Configuration::ServerConnectionConfig const& config, std::string clientSecret)
    : m_config(config)
    , m_clientSecret(std::move(clientSecret))
    , m_sendAttempt(0)
    , m_optCurrentSession()
    , m_isRegistrationStarted(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ServerConnectionConfig const& Authentication::PendingSessionData::GetConnectionConfig() const
{
    return m_config;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Authentication::PendingSessionData::GetClientSecret() const { return m_clientSecret; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Authentication::PendingSessionData::GetSendAttempt() const { return m_sendAttempt; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Authentication::PendingSessionData::GetCurrentSession() const
{
    return m_optCurrentSession;
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::PendingSessionData::IsRegistrationStarted() const { return m_isRegistrationStarted; }

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSessionData::SetCurrentSession(std::optional<std::string> const& optSession)
{
    m_optCurrentSession = optSession;
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSessionData::SetRegistrationStarted(bool started) { m_isRegistrationStarted = started; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Authentication::PendingSessionData::IncrementSendAttempt() { return ++m_sendAttempt; }

//----------------------------------------------------------------------------------------------------------------------

Authentication::PendingSessionData Authentication::PendingSessionData::Demote() const
{
    return PendingSessionData{ m_config };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::value Authentication::PendingSessionData::Write() const
{
    boost::json::object json;
    json[symbols::Config] = m_config.Write();
    json[symbols::ClientSecret] = m_clientSecret;
    json[symbols::SendAttempt] = m_sendAttempt;
    if (m_optCurrentSession) { json[symbols::CurrentSession] = *m_optCurrentSession; }
    json[symbols::RegistrationStarted] = m_isRegistrationStarted;
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Authentication::PendingSessionData> Authentication::PendingSessionData::Read(
    boost::json::value const& json)
{
    auto const* const pObject = json.if_object();
    if (!pObject) { return {}; }

    auto const config = pObject->find(symbols::Config);
    if (config == pObject->end()) { return {}; }

    auto const optConfig = Configuration::ServerConnectionConfig::Read(config->value());
    if (!optConfig) { return {}; }

    auto const secret = pObject->find(symbols::ClientSecret);
    if (secret == pObject->end() || !secret->value().is_string() || secret->value().get_string().empty()) {
        return {};
    }

    PendingSessionData data{ *optConfig, std::string{ secret->value().get_string() } };

    if (auto const itr = pObject->find(symbols::SendAttempt); itr != pObject->end()) {
        auto const& value = itr->value();
        if (value.is_uint64() && value.get_uint64() <= std::numeric_limits<std::uint32_t>::max()) {
            data.m_sendAttempt = static_cast<std::uint32_t>(value.get_uint64());
        } else if (value.is_int64() && value.get_int64() >= 0 && value.get_int64() <= std::numeric_limits<std::uint32_t>::max()) {
            data.m_sendAttempt = static_cast<std::uint32_t>(value.get_int64());
        } else {
            return {};
        }
    }

    if (auto const itr = pObject->find(symbols::CurrentSession); itr != pObject->end()) {
        if (!itr->value().is_string()) { return {}; }
        data.m_optCurrentSession = std::string{ itr->value().get_string() };
    }

    if (auto const itr = pObject->find(symbols::RegistrationStarted); itr != pObject->end()) {
        if (!itr->value().is_bool()) { return {}; }
        data.m_isRegistrationStarted = itr->value().get_bool();
    }

    return data;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GenerateClientSecret()
{
    constexpr std::string_view Alphabet = "0123456789abcdef";

    std::array<std::uint8_t, Authentication::PendingSessionData::ClientSecretSize> buffer;
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes for the client secret!");
    }

    std::string secret;
    secret.reserve(buffer.size() * 2);
    for (auto const byte : buffer) {
        secret.push_back(Alphabet[byte >> 4]);
        secret.push_back(Alphabet[byte & 0x0F]);
    }
    return secret;
}

//----------------------------------------------------------------------------------------------------------------------
