//----------------------------------------------------------------------------------------------------------------------
// File: TestHelpers.hpp
// Description: Scripted stand-ins for the collaborators consumed by discovery and authentication. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Authentication/Credentials.hpp"
#include "Components/Authentication/PendingSessionData.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
#include "Components/Configuration/StatusCode.hpp"
#include "Components/Discovery/Outcome.hpp"
#include "Components/Failure/Failure.hpp"
#include "Components/Network/Http.hpp"
#include "Components/Scheduler/Registrar.hpp"
#include "Components/Session/SessionParams.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Interfaces/HttpClient.hpp"
#include "Interfaces/PendingSessionStore.hpp"
#include "Interfaces/Session.hpp"
#include "Interfaces/SessionManager.hpp"
#include "Interfaces/SessionStore.hpp"
#include "Interfaces/WellKnownResolver.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Test {
//----------------------------------------------------------------------------------------------------------------------

class HttpClient;
class ClientFactory;
class WellKnownResolver;
class PendingSessionStore;
class SessionStore;
class Session;
class SessionManager;

constexpr std::string_view HomeServerUrl = "https://matrix.example.org";
constexpr std::string_view UserId = "@alice:example.org";
constexpr std::string_view DeviceId = "DEVICEID";
constexpr std::string_view AccessToken = "syt_access_token";

constexpr std::string_view SupportedVersions = R"({"versions":["r0.5.0","r0.6.0"],"unstable_features":{}})";
constexpr std::string_view LegacyVersions = R"({"versions":["r0.4.0"],"unstable_features":{}})";
constexpr std::string_view PasswordFlows = R"({"flows":[{"type":"m.login.password"},{"type":"m.login.sso"}]})";

[[nodiscard]] Configuration::ServerConnectionConfig CreateConfig(std::string_view url = HomeServerUrl);
[[nodiscard]] Network::Http::Response CreateResponse(std::int32_t status, std::string_view body = "{}");
[[nodiscard]] std::string CreateLoginResponse(std::string_view userId = UserId, std::string_view deviceId = DeviceId);
[[nodiscard]] Authentication::Credentials CreateCredentials(
    std::string_view userId = UserId, std::string_view deviceId = DeviceId);

// Drives the main context until the predicate holds or the timeout elapses. Returns the final predicate result. 
bool RunUntil(
    std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
    std::function<bool()> const& predicate,
    std::chrono::milliseconds timeout = std::chrono::seconds{ 5 });

//----------------------------------------------------------------------------------------------------------------------
} // Test namespace
//----------------------------------------------------------------------------------------------------------------------

// Responds to requests from a script keyed on the method and url. Unscripted requests receive an HTTP 404. Every 
// request is recorded, requests may be issued from any thread. 
class Test::HttpClient : public IHttpClient
{
public:
    using Result = Failure::Expected<Network::Http::Response>;

    HttpClient() = default;

    void Script(Network::Http::Method method, std::string_view url, Result const& result)
    {
        std::scoped_lock lock{ m_mutex };
        m_script.insert_or_assign(std::make_pair(method, std::string{ url }), result);
    }

    void Script(Network::Http::Method method, std::string_view url, std::int32_t status, std::string_view body = "{}")
    {
        Script(method, url, Result{ CreateResponse(status, body) });
    }

    [[nodiscard]] std::vector<Network::Http::Request> GetRequests() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_requests;
    }

    [[nodiscard]] std::vector<std::string> GetRequestedUrls() const
    {
        std::scoped_lock lock{ m_mutex };
        std::vector<std::string> urls;
        std::ranges::transform(m_requests, std::back_inserter(urls), [] (auto const& request) { return request.url; });
        return urls;
    }

    [[nodiscard]] std::size_t RequestCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_requests.size();
    }

    // IHttpClient {
    [[nodiscard]] virtual Result Execute(Network::Http::Request const& request) override
    {
        std::scoped_lock lock{ m_mutex };
        m_requests.emplace_back(request);
        if (auto const itr = m_script.find(std::make_pair(request.method, request.url)); itr != m_script.end()) {
            return itr->second;
        }
        return Result{ CreateResponse(Network::Http::Status::NotFound, R"({"errcode":"M_NOT_FOUND"})") };
    }
    // } IHttpClient

private:
    using Key = std::pair<Network::Http::Method, std::string>;

    mutable std::mutex m_mutex;
    std::map<Key, Result> m_script;
    std::vector<Network::Http::Request> m_requests;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::ClientFactory : public IClientFactory
{
public:
    explicit ClientFactory(std::shared_ptr<Test::HttpClient> const& spClient) : m_spClient(spClient) {}

    [[nodiscard]] std::size_t BuildCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_configs.size();
    }

    [[nodiscard]] std::vector<Configuration::ServerConnectionConfig> GetBuiltConfigs() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_configs;
    }

    // IClientFactory {
    [[nodiscard]] virtual std::shared_ptr<IHttpClient> BuildClient(
        Configuration::ServerConnectionConfig const& config) override
    {
        std::scoped_lock lock{ m_mutex };
        m_configs.emplace_back(config);
        return m_spClient;
    }
    // } IClientFactory

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<Test::HttpClient> m_spClient;
    std::vector<Configuration::ServerConnectionConfig> m_configs;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::WellKnownResolver : public IWellKnownResolver
{
public:
    using Result = Failure::Expected<Discovery::WellKnownResult>;

    WellKnownResolver() : m_mutex(), m_result(Discovery::WellKnown::Ignore{}), m_matrixIds() {}

    void SetResult(Result const& result)
    {
        std::scoped_lock lock{ m_mutex };
        m_result = result;
    }

    [[nodiscard]] std::vector<std::string> GetResolvedIds() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_matrixIds;
    }

    // IWellKnownResolver {
    [[nodiscard]] virtual Result Resolve(
        std::string_view matrixId, std::optional<Configuration::ServerConnectionConfig> const&) override
    {
        std::scoped_lock lock{ m_mutex };
        m_matrixIds.emplace_back(matrixId);
        return m_result;
    }
    // } IWellKnownResolver

private:
    mutable std::mutex m_mutex;
    Result m_result;
    std::vector<std::string> m_matrixIds;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::PendingSessionStore : public IPendingSessionStore
{
public:
    PendingSessionStore() : m_mutex(), m_optData(), m_saved(0), m_deleted(0) {}

    [[nodiscard]] std::size_t SaveCount() const { std::scoped_lock lock{ m_mutex }; return m_saved; }
    [[nodiscard]] std::size_t DeleteCount() const { std::scoped_lock lock{ m_mutex }; return m_deleted; }

    // IPendingSessionStore {
    [[nodiscard]] virtual std::optional<Authentication::PendingSessionData> Load() const override
    {
        std::scoped_lock lock{ m_mutex };
        return m_optData;
    }

    virtual Configuration::StatusCode Save(Authentication::PendingSessionData const& data) override
    {
        std::scoped_lock lock{ m_mutex };
        m_optData = data;
        ++m_saved;
        return Configuration::StatusCode::Success;
    }

    virtual Configuration::StatusCode Delete() override
    {
        std::scoped_lock lock{ m_mutex };
        m_optData.reset();
        ++m_deleted;
        return Configuration::StatusCode::Success;
    }
    // } IPendingSessionStore

private:
    mutable std::mutex m_mutex;
    std::optional<Authentication::PendingSessionData> m_optData;
    std::size_t m_saved;
    std::size_t m_deleted;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::SessionStore : public ISessionStore
{
public:
    SessionStore() = default;

    // ISessionStore {
    [[nodiscard]] virtual std::optional<::Session::Params> Get(std::string_view sessionId) const override
    {
        std::scoped_lock lock{ m_mutex };
        auto const itr = std::ranges::find_if(m_records, [&] (auto const& record) {
            return record.GetSessionId() == sessionId;
        });
        if (itr == m_records.end()) { return {}; }
        return *itr;
    }

    [[nodiscard]] virtual std::optional<::Session::Params> GetLast() const override
    {
        std::scoped_lock lock{ m_mutex };
        if (m_records.empty()) { return {}; }
        return m_records.back();
    }

    [[nodiscard]] virtual std::vector<::Session::Params> GetAll() const override
    {
        std::scoped_lock lock{ m_mutex };
        return m_records;
    }

    virtual Configuration::StatusCode Save(::Session::Params const& params) override
    {
        std::scoped_lock lock{ m_mutex };
        std::erase_if(m_records, [&] (auto const& record) { return record.GetSessionId() == params.GetSessionId(); });
        m_records.emplace_back(params);
        return Configuration::StatusCode::Success;
    }

    virtual Configuration::StatusCode Delete(std::string_view sessionId) override
    {
        std::scoped_lock lock{ m_mutex };
        auto const erased = std::erase_if(m_records, [&] (auto const& record) {
            return record.GetSessionId() == sessionId;
        });
        return (erased != 0) ? Configuration::StatusCode::Success : Configuration::StatusCode::InputError;
    }
    // } ISessionStore

private:
    mutable std::mutex m_mutex;
    std::vector<::Session::Params> m_records;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::Session : public ISession
{
public:
    explicit Session(::Session::Params const& params) : m_params(params) {}

    // ISession {
    [[nodiscard]] virtual std::string const& GetSessionId() const override { return m_params.GetSessionId(); }
    [[nodiscard]] virtual ::Session::Params const& GetParams() const override { return m_params; }
    // } ISession

private:
    ::Session::Params m_params;
};

//----------------------------------------------------------------------------------------------------------------------

class Test::SessionManager : public ISessionManager
{
public:
    SessionManager() = default;

    [[nodiscard]] std::size_t SessionCount() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_sessions.size();
    }

    // ISessionManager {
    [[nodiscard]] virtual std::shared_ptr<ISession> GetOrCreateSession(::Session::Params const& params) override
    {
        std::scoped_lock lock{ m_mutex };
        auto& spSession = m_sessions[params.GetSessionId()];
        if (!spSession) { spSession = std::make_shared<Test::Session>(params); }
        return spSession;
    }
    // } ISessionManager

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<ISession>, std::less<>> m_sessions;
};

//----------------------------------------------------------------------------------------------------------------------

inline Configuration::ServerConnectionConfig Test::CreateConfig(std::string_view url)
{
    auto const optConfig = Configuration::ServerConnectionConfig::Builder{}.SetHomeServerUri(url).Build();
    return optConfig.value();
}

//----------------------------------------------------------------------------------------------------------------------

inline Network::Http::Response Test::CreateResponse(std::int32_t status, std::string_view body)
{
    return Network::Http::Response{ status, std::string{ body } };
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Test::CreateLoginResponse(std::string_view userId, std::string_view deviceId)
{
    std::string response = R"({"user_id":")";
    response.append(userId);
    response.append(R"(","access_token":")");
    response.append(AccessToken);
    response.append(R"(","home_server":"example.org","device_id":")");
    response.append(deviceId);
    response.append(R"("})");
    return response;
}

//----------------------------------------------------------------------------------------------------------------------

inline Authentication::Credentials Test::CreateCredentials(std::string_view userId, std::string_view deviceId)
{
    Authentication::Credentials credentials;
    credentials.userId = userId;
    credentials.accessToken = AccessToken;
    credentials.homeServer = "example.org";
    credentials.deviceId = deviceId;
    return credentials;
}

//----------------------------------------------------------------------------------------------------------------------

inline bool Test::RunUntil(
    std::shared_ptr<Scheduler::Registrar> const& spRegistrar,
    std::function<bool()> const& predicate,
    std::chrono::milliseconds timeout)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate() && std::chrono::steady_clock::now() < deadline) {
        spRegistrar->AwaitTask(std::chrono::milliseconds{ 10 });
        spRegistrar->Execute();
    }
    return predicate();
}

//----------------------------------------------------------------------------------------------------------------------
