//----------------------------------------------------------------------------------------------------------------------
#include "Components/Api/Client.hpp"
#include "Components/Configuration/Fingerprint.hpp"
#include "Tests/Shared/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view BaseUrl = "https://good.example";
constexpr std::string_view VersionsUrl = "https://good.example/_matrix/client/versions";
constexpr std::string_view LoginUrl = "https://good.example/_matrix/client/r0/login";
constexpr std::string_view RegisterUrl = "https://good.example/_matrix/client/r0/register";
constexpr std::string_view LegacyConfigUrl = "https://good.example/config.json";
constexpr std::string_view WellKnownUrl = "https://good.example/.well-known/matrix/client";
constexpr std::string_view IdentityUrl = "https://good.example/_matrix/identity/api/v1";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, FetchVersionsTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    spHttpClient->Script(Method::Get, test::VersionsUrl, Status::Ok, Test::SupportedVersions);
    auto const result = client.FetchVersions();
    ASSERT_TRUE(Failure::HasValue(result));
    EXPECT_EQ(std::get<Discovery::Versions>(result).GetVersions(), (std::vector<std::string>{ "r0.5.0", "r0.6.0" }));

    spHttpClient->Script(Method::Get, test::VersionsUrl, Status::Ok, R"({"versions":"r0.6.0"})");
    auto const malformed = client.FetchVersions();
    ASSERT_FALSE(Failure::HasValue(malformed));
    EXPECT_TRUE(std::holds_alternative<Failure::MalformedResponse>(*Failure::GetReason(malformed)));

    spHttpClient->Script(Method::Get, test::VersionsUrl, Status::Ok, "<html></html>");
    auto const garbage = client.FetchVersions();
    ASSERT_FALSE(Failure::HasValue(garbage));
    EXPECT_TRUE(std::holds_alternative<Failure::MalformedResponse>(*Failure::GetReason(garbage)));

    EXPECT_EQ(spHttpClient->GetRequestedUrls(), std::vector<std::string>(3, std::string{ test::VersionsUrl }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, FetchLoginFlowsTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    spHttpClient->Script(Method::Get, test::LoginUrl, Status::Ok,
        R"({"flows":[{"type":"m.login.password"},{"stages":[]},{"type":7},{"type":"m.login.sso"}]})");
    auto const result = client.FetchLoginFlows();
    ASSERT_TRUE(Failure::HasValue(result));
    EXPECT_EQ(std::get<std::vector<std::string>>(result),
        (std::vector<std::string>{ "m.login.password", "m.login.sso" }));

    spHttpClient->Script(Method::Get, test::LoginUrl, Status::Ok, "{}");
    auto const empty = client.FetchLoginFlows();
    ASSERT_TRUE(Failure::HasValue(empty));
    EXPECT_TRUE(std::get<std::vector<std::string>>(empty).empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, ServerErrorTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    spHttpClient->Script(Method::Get, test::LoginUrl, 403, R"({"errcode":"M_FORBIDDEN","error":"Nope"})");
    auto const forbidden = client.FetchLoginFlows();
    ASSERT_FALSE(Failure::HasValue(forbidden));
    auto const* const pError = std::get_if<Failure::ServerError>(Failure::GetReason(forbidden));
    ASSERT_TRUE(pError);
    EXPECT_EQ(pError->code, 403);
    EXPECT_EQ(pError->errcode, "M_FORBIDDEN");
    EXPECT_EQ(pError->message, "Nope");

    // Error bodies from proxies are not required to be JSON. 
    spHttpClient->Script(Method::Get, test::LoginUrl, 502, "Bad Gateway");
    auto const gateway = client.FetchLoginFlows();
    ASSERT_FALSE(Failure::HasValue(gateway));
    auto const* const pGateway = std::get_if<Failure::ServerError>(Failure::GetReason(gateway));
    ASSERT_TRUE(pGateway);
    EXPECT_EQ(pGateway->code, 502);
    EXPECT_TRUE(pGateway->errcode.empty());

    // Unscripted requests are answered with a 404. 
    auto const legacy = client.FetchLegacyConfig();
    ASSERT_FALSE(Failure::HasValue(legacy));
    EXPECT_TRUE(Failure::IsNotFound(*Failure::GetReason(legacy)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, TransportFailureTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    auto const optFingerprint = Configuration::Fingerprint::FromHex(
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", Configuration::Fingerprint::HashType::Sha256);
    ASSERT_TRUE(optFingerprint);

    spHttpClient->Script(Method::Get, test::VersionsUrl, Test::HttpClient::Result{
        Failure::Reason{ Failure::UnrecognizedCertificate{ std::string{ test::BaseUrl }, *optFingerprint } } });
    auto const untrusted = client.FetchVersions();
    ASSERT_FALSE(Failure::HasValue(untrusted));
    auto const* const pCertificate = std::get_if<Failure::UnrecognizedCertificate>(Failure::GetReason(untrusted));
    ASSERT_TRUE(pCertificate);
    EXPECT_EQ(pCertificate->fingerprint, *optFingerprint);

    spHttpClient->Script(Method::Get, test::IdentityUrl, Test::HttpClient::Result{
        Failure::Reason{ Failure::Transport{ "Connection refused" } } });
    auto const ping = client.PingIdentityServer();
    ASSERT_FALSE(Failure::HasValue(ping));
    EXPECT_TRUE(std::holds_alternative<Failure::Transport>(*Failure::GetReason(ping)));

    spHttpClient->Script(Method::Get, test::IdentityUrl, Status::Ok, "");
    EXPECT_TRUE(Failure::HasValue(client.PingIdentityServer()));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, DiscoveryDocumentTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    spHttpClient->Script(Method::Get, test::LegacyConfigUrl, Status::Ok,
        R"({"default_hs_url":"https://real.example","brand":"Element"})");
    auto const legacy = client.FetchLegacyConfig();
    ASSERT_TRUE(Failure::HasValue(legacy));
    EXPECT_EQ(std::get<Discovery::LegacyConfig>(legacy).defaultHomeServerUrl, "https://real.example");

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.good.example"},"m.identity_server":{"base_url":"https://vector.im"}})");
    auto const wellKnown = client.FetchWellKnown();
    ASSERT_TRUE(Failure::HasValue(wellKnown));
    EXPECT_EQ(std::get<Discovery::ClientWellKnown>(wellKnown).homeServerBaseUrl, "https://matrix.good.example");
    EXPECT_EQ(std::get<Discovery::ClientWellKnown>(wellKnown).identityServerBaseUrl, "https://vector.im");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, LoginTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    boost::json::object const body = { { "type", "m.login.password" }, { "password", "hunter2" } };

    spHttpClient->Script(Method::Post, test::LoginUrl, Status::Ok, Test::CreateLoginResponse());
    auto const result = client.Login(body);
    ASSERT_TRUE(Failure::HasValue(result));
    auto const& credentials = std::get<Authentication::Credentials>(result);
    EXPECT_EQ(credentials.userId, Test::UserId);
    EXPECT_EQ(credentials.deviceId, Test::DeviceId);
    EXPECT_EQ(credentials.accessToken, Test::AccessToken);

    auto const requests = spHttpClient->GetRequests();
    ASSERT_EQ(requests.size(), std::size_t(1));
    EXPECT_EQ(requests.front().method, Method::Post);
    ASSERT_TRUE(requests.front().body);
    EXPECT_EQ(boost::json::parse(*requests.front().body), boost::json::value(body));

    spHttpClient->Script(Method::Post, test::LoginUrl, Status::Ok, R"({"device_id":"DEVICEID"})");
    auto const incomplete = client.Login(body);
    ASSERT_FALSE(Failure::HasValue(incomplete));
    EXPECT_TRUE(std::holds_alternative<Failure::MalformedResponse>(*Failure::GetReason(incomplete)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ApiClientSuite, RegisterTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Api::Client const client{ spHttpClient, Network::Uri::Parse(test::BaseUrl) };

    spHttpClient->Script(Method::Post, test::RegisterUrl, Status::Unauthorized,
        R"({"session":"uia","flows":[{"stages":["m.login.recaptcha","m.login.dummy"]}],"completed":[],)"
        R"("params":{"m.login.recaptcha":{"public_key":"key"}}})");
    auto const continuation = client.Register({});
    ASSERT_TRUE(Failure::HasValue(continuation));
    auto const* const pFlows = std::get_if<Authentication::FlowResponse>(
        &std::get<Api::RegistrationResponse>(continuation));
    ASSERT_TRUE(pFlows);
    EXPECT_EQ(pFlows->session, "uia");
    ASSERT_EQ(pFlows->flows.size(), std::size_t(1));
    EXPECT_EQ(pFlows->flows.front(), (std::vector<std::string>{ "m.login.recaptcha", "m.login.dummy" }));

    // An unauthorized response without flows is a plain error. 
    spHttpClient->Script(Method::Post, test::RegisterUrl, Status::Unauthorized, R"({"errcode":"M_UNAUTHORIZED"})");
    auto const rejected = client.Register({});
    ASSERT_FALSE(Failure::HasValue(rejected));
    auto const* const pError = std::get_if<Failure::ServerError>(Failure::GetReason(rejected));
    ASSERT_TRUE(pError);
    EXPECT_EQ(pError->code, Status::Unauthorized);
    EXPECT_EQ(pError->errcode, "M_UNAUTHORIZED");

    spHttpClient->Script(Method::Post, test::RegisterUrl, Status::Ok, Test::CreateLoginResponse());
    auto const created = client.Register({});
    ASSERT_TRUE(Failure::HasValue(created));
    EXPECT_TRUE(std::holds_alternative<Authentication::Credentials>(std::get<Api::RegistrationResponse>(created)));
}

//----------------------------------------------------------------------------------------------------------------------
