//----------------------------------------------------------------------------------------------------------------------
#include "Components/Discovery/WellKnownResolver.hpp"
#include "Tests/Shared/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Discovery::WellKnownResult ResolveResult(
    Discovery::WellKnownResolver& resolver, std::string_view matrixId = "@alice:example.org");

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view WellKnownUrl = "https://example.org/.well-known/matrix/client";
constexpr std::string_view HomeServerVersionsUrl = "https://matrix.example.org/_matrix/client/versions";
constexpr std::string_view IdentityServerUrl = "https://vector.im/_matrix/identity/api/v1";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, GetDomainTest)
{
    EXPECT_EQ(Discovery::WellKnownResolver::GetDomain("@alice:example.org"), "example.org");
    EXPECT_EQ(Discovery::WellKnownResolver::GetDomain("@alice:example.org:8448"), "example.org:8448");
    EXPECT_EQ(Discovery::WellKnownResolver::GetDomain("@a:b"), "b");

    EXPECT_FALSE(Discovery::WellKnownResolver::GetDomain(""));
    EXPECT_FALSE(Discovery::WellKnownResolver::GetDomain("alice:example.org"));
    EXPECT_FALSE(Discovery::WellKnownResolver::GetDomain("@alice"));
    EXPECT_FALSE(Discovery::WellKnownResolver::GetDomain("@:example.org"));
    EXPECT_FALSE(Discovery::WellKnownResolver::GetDomain("@alice:"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, InvalidIdentifierTest)
{
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Discovery::WellKnownResolver resolver{ std::make_shared<Test::ClientFactory>(spHttpClient) };

    auto const result = local::ResolveResult(resolver, "alice");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::InvalidMatrixId>(result));
    EXPECT_EQ(spHttpClient->RequestCount(), std::size_t(0));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, IgnoreTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Discovery::WellKnownResolver resolver{ std::make_shared<Test::ClientFactory>(spHttpClient) };

    // The domain does not publish a document. 
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::Ignore>(local::ResolveResult(resolver)));
    EXPECT_EQ(spHttpClient->GetRequestedUrls(), std::vector<std::string>{ std::string{ test::WellKnownUrl } });

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Test::HttpClient::Result{
        Failure::Reason{ Failure::Transport{ "Host not found" } } });
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::Ignore>(local::ResolveResult(resolver)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, FailPromptTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Discovery::WellKnownResolver resolver{ std::make_shared<Test::ClientFactory>(spHttpClient) };

    spHttpClient->Script(Method::Get, test::WellKnownUrl, 500);
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailPrompt>(local::ResolveResult(resolver)));

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok, "not json");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailPrompt>(local::ResolveResult(resolver)));

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok, R"({"m.identity_server":{}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailPrompt>(local::ResolveResult(resolver)));

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok, R"({"m.homeserver":{"base_url":""}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailPrompt>(local::ResolveResult(resolver)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, FailErrorTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    Discovery::WellKnownResolver resolver{ std::make_shared<Test::ClientFactory>(spHttpClient) };

    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok, R"({"m.homeserver":{"base_url":"matrix"}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailError>(local::ResolveResult(resolver)));

    // The advertised homeserver must answer the versions probe. 
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.example.org/"}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailError>(local::ResolveResult(resolver)));

    spHttpClient->Script(Method::Get, test::HomeServerVersionsUrl, Status::Ok, Test::SupportedVersions);
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.example.org"},"m.identity_server":{"base_url":""}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailError>(local::ResolveResult(resolver)));

    // The advertised identity server must be reachable. 
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.example.org"},"m.identity_server":{"base_url":"https://vector.im"}})");
    EXPECT_TRUE(std::holds_alternative<Discovery::WellKnown::FailError>(local::ResolveResult(resolver)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, PromptTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    auto const spClientFactory = std::make_shared<Test::ClientFactory>(spHttpClient);
    Discovery::WellKnownResolver resolver{ spClientFactory };

    spHttpClient->Script(Method::Get, test::HomeServerVersionsUrl, Status::Ok, Test::SupportedVersions);
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.example.org/"}})");

    auto const result = local::ResolveResult(resolver);
    auto const* const pPrompt = std::get_if<Discovery::WellKnown::Prompt>(&result);
    ASSERT_TRUE(pPrompt);
    EXPECT_EQ(pPrompt->homeServerUrl, "https://matrix.example.org");
    EXPECT_FALSE(pPrompt->identityServerUrl);

    spHttpClient->Script(Method::Get, test::IdentityServerUrl, Status::Ok);
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Status::Ok,
        R"({"m.homeserver":{"base_url":"https://matrix.example.org"},"m.identity_server":{"base_url":"https://vector.im/"}})");

    auto const withIdentity = local::ResolveResult(resolver);
    ASSERT_TRUE(std::holds_alternative<Discovery::WellKnown::Prompt>(withIdentity));
    EXPECT_EQ(std::get<Discovery::WellKnown::Prompt>(withIdentity),
        (Discovery::WellKnown::Prompt{ "https://matrix.example.org", "https://vector.im" }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(WellKnownResolverSuite, TransportOptionsTest)
{
    using namespace Network::Http;
    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    auto const spClientFactory = std::make_shared<Test::ClientFactory>(spHttpClient);
    Discovery::WellKnownResolver resolver{ spClientFactory };

    auto const optFingerprint = Configuration::Fingerprint::FromHex(
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", Configuration::Fingerprint::HashType::Sha256);
    ASSERT_TRUE(optFingerprint);

    auto const config = Test::CreateConfig("https://matrix.example.org").WithAllowedFingerprint(*optFingerprint);
    spHttpClient->Script(Method::Get, test::WellKnownUrl, Test::HttpClient::Result{
        Failure::Reason{ Failure::UnrecognizedCertificate{ "https://example.org", *optFingerprint } } });

    // Certificate failures can not be interpreted as an outcome, they must reach the caller. 
    auto const result = resolver.Resolve("@alice:example.org", config);
    ASSERT_FALSE(Failure::HasValue(result));
    EXPECT_TRUE(std::holds_alternative<Failure::UnrecognizedCertificate>(*Failure::GetReason(result)));

    auto const configs = spClientFactory->GetBuiltConfigs();
    ASSERT_EQ(configs.size(), std::size_t(1));
    EXPECT_EQ(configs.front().GetHomeServerUri().ToString(), "https://example.org");
    EXPECT_TRUE(configs.front().IsTrusted(*optFingerprint));
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::WellKnownResult local::ResolveResult(Discovery::WellKnownResolver& resolver, std::string_view matrixId)
{
    auto result = resolver.Resolve(matrixId, {});
    if (auto const* const pReason = Failure::GetReason(result); pReason) {
        ADD_FAILURE() << "Unexpected failure: " << Failure::ToString(*pReason);
        return Discovery::WellKnown::FailError{};
    }
    return std::get<Discovery::WellKnownResult>(std::move(result));
}

//----------------------------------------------------------------------------------------------------------------------
