//----------------------------------------------------------------------------------------------------------------------
#include "TestResources.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Authentication/LoginWizard.hpp"
#include "Components/Authentication/RegistrationWizard.hpp"
#include "Components/Authentication/StateError.hpp"
#include "Components/Network/Uri.hpp"
#include "Components/Session/SessionParams.hpp"
#include "Interfaces/Session.hpp"
#include "Tests/Shared/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string EndpointUrl(std::string_view endpoint);
[[nodiscard]] boost::json::value GetLastBody(Test::HttpClient const& client);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Password = "correct horse battery staple";
constexpr std::string_view DeviceName = "homeport tests";

constexpr std::string_view RegistrationFlows = 
    R"({"session":"uia","flows":[{"stages":["m.login.recaptcha","m.login.dummy"]},{"stages":["m.login.dummy"]}],)"
    R"("completed":[],"params":{"m.login.recaptcha":{"public_key":"key"}}})";

constexpr std::string_view ContinuedFlows = 
    R"({"session":"uia","flows":[{"stages":["m.login.recaptcha","m.login.dummy"]}],)"
    R"("completed":["m.login.recaptcha"],"params":{}})";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(LoginWizardSuite, PasswordLoginBodyTest)
{
    auto const user = Authentication::LoginWizard::CreatePasswordLogin(Test::UserId, test::Password, test::DeviceName);
    EXPECT_EQ(boost::json::value(user), boost::json::parse(R"({
        "type": "m.login.password",
        "identifier": { "type": "m.id.user", "user": "@alice:example.org" },
        "password": "correct horse battery staple",
        "initial_device_display_name": "homeport tests"
    })"));

    auto const email = Authentication::LoginWizard::CreatePasswordLogin("alice@example.org", test::Password, "");
    EXPECT_EQ(boost::json::value(email), boost::json::parse(R"({
        "type": "m.login.password",
        "identifier": { "type": "m.id.thirdparty", "medium": "email", "address": "alice@example.org" },
        "password": "correct horse battery staple"
    })"));

    // A bare localpart is still a user identifier. 
    auto const localpart = Authentication::LoginWizard::CreatePasswordLogin("alice", test::Password, "");
    EXPECT_EQ(localpart.at("identifier").at("type").as_string(), Authentication::Identifiers::User);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LoginWizardSuite, TokenLoginBodyTest)
{
    auto const body = Authentication::LoginWizard::CreateTokenLogin("sso_token");
    EXPECT_EQ(boost::json::value(body), boost::json::parse(R"({"type":"m.login.token","token":"sso_token"})"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LoginWizardSuite, LoginTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    resources.GetPendingSession().Set(Test::CreateConfig());
    resources.GetHttpClient().Script(
        Method::Post, local::EndpointUrl(Api::Endpoints::Login), Status::Ok, Test::CreateLoginResponse());

    std::optional<Failure::Expected<std::shared_ptr<ISession>>> optResult;
    auto const spWizard = resources.GetService().GetLoginWizard();
    auto const spTask = spWizard->Login(Test::UserId, test::Password, test::DeviceName, [&] (auto&& result) {
        optResult = std::move(result);
    });
    ASSERT_TRUE(spTask);
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));

    auto const& spSession = std::get<std::shared_ptr<ISession>>(*optResult);
    ASSERT_TRUE(spSession);
    EXPECT_EQ(spSession->GetSessionId(), Session::CreateSessionId(Test::UserId, Test::DeviceId));
    EXPECT_EQ(spSession->GetParams().GetConnectionConfig(), Test::CreateConfig());
    EXPECT_EQ(resources.GetSessionManager().SessionCount(), std::size_t(1));
    EXPECT_TRUE(resources.GetSessionStore().Get(spSession->GetSessionId()));

    auto const body = local::GetLastBody(resources.GetHttpClient());
    EXPECT_EQ(body.at("identifier").at("user").as_string(), Test::UserId);
    EXPECT_EQ(body.at("initial_device_display_name").as_string(), test::DeviceName);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LoginWizardSuite, LoginWithTokenTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    resources.GetPendingSession().Set(Test::CreateConfig());
    resources.GetHttpClient().Script(
        Method::Post, local::EndpointUrl(Api::Endpoints::Login), Status::Ok, Test::CreateLoginResponse());

    std::optional<Failure::Expected<std::shared_ptr<ISession>>> optResult;
    std::ignore = resources.GetService().GetLoginWizard()->LoginWithToken("sso_token", [&] (auto&& result) {
        optResult = std::move(result);
    });
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_EQ(local::GetLastBody(resources.GetHttpClient()).at("token").as_string(), "sso_token");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(LoginWizardSuite, RejectedLoginTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    resources.GetPendingSession().Set(Test::CreateConfig());
    resources.GetHttpClient().Script(Method::Post, local::EndpointUrl(Api::Endpoints::Login), 403,
        R"({"errcode":"M_FORBIDDEN","error":"Invalid password"})");

    std::optional<Failure::Expected<std::shared_ptr<ISession>>> optResult;
    std::ignore = resources.GetService().GetLoginWizard()->Login(Test::UserId, "wrong", "", [&] (auto&& result) {
        optResult = std::move(result);
    });
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_FALSE(Failure::HasValue(*optResult));

    auto const* const pError = std::get_if<Failure::ServerError>(Failure::GetReason(*optResult));
    ASSERT_TRUE(pError);
    EXPECT_EQ(pError->code, 403);
    EXPECT_EQ(pError->errcode, "M_FORBIDDEN");
    EXPECT_EQ(pError->message, "Invalid password");

    // A rejected login leaves no trace. 
    EXPECT_EQ(resources.GetSessionManager().SessionCount(), std::size_t(0));
    EXPECT_FALSE(resources.GetSessionStore().GetLast());
    EXPECT_TRUE(resources.GetPendingSession().HasData());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RegistrationWizardSuite, UnstartedStageTest)
{
    Test::AuthenticationResources resources;
    resources.GetPendingSession().Set(Test::CreateConfig());

    auto const spWizard = resources.GetService().GetRegistrationWizard();
    EXPECT_FALSE(spWizard->IsRegistrationStarted());
    EXPECT_FALSE(spWizard->GetCurrentSession());

    auto const discard = [] (auto&&) {};
    EXPECT_THROW(std::ignore = spWizard->Dummy(discard), Authentication::StateError);
    EXPECT_THROW(std::ignore = spWizard->AcceptTerms(discard), Authentication::StateError);
    EXPECT_THROW(std::ignore = spWizard->PerformReCaptcha("captcha", discard), Authentication::StateError);
    EXPECT_EQ(resources.GetHttpClient().RequestCount(), std::size_t(0));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RegistrationWizardSuite, RegistrationFlowTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    auto& client = resources.GetHttpClient();
    auto const registerUrl = local::EndpointUrl(Api::Endpoints::Register);
    resources.GetPendingSession().Set(Test::CreateConfig());

    auto const spWizard = resources.GetService().GetRegistrationWizard();
    std::optional<Failure::Expected<Authentication::RegistrationResult>> optResult;
    auto const capture = [&] (auto&& result) { optResult = std::move(result); };

    // Fetching the flows opens a registration session, but does not start the registration. 
    client.Script(Method::Post, registerUrl, Status::Unauthorized, test::RegistrationFlows);
    std::ignore = spWizard->FetchRegistrationFlow(capture);
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_EQ(local::GetLastBody(client), boost::json::value(boost::json::object{}));

    {
        auto const* const pFlows = std::get_if<Authentication::FlowResult>(
            &std::get<Authentication::RegistrationResult>(*optResult));
        ASSERT_TRUE(pFlows);
        ASSERT_EQ(pFlows->missingStages.size(), std::size_t(2));
        EXPECT_EQ(pFlows->missingStages[0].type, Authentication::Stages::ReCaptcha);
        EXPECT_FALSE(pFlows->missingStages[0].mandatory);
        EXPECT_EQ(pFlows->missingStages[0].params, boost::json::parse(R"({"public_key":"key"})"));
        EXPECT_EQ(pFlows->missingStages[1].type, Authentication::Stages::Dummy);
        EXPECT_TRUE(pFlows->missingStages[1].mandatory);
        EXPECT_TRUE(pFlows->completedStages.empty());
    }

    EXPECT_EQ(spWizard->GetCurrentSession(), "uia");
    EXPECT_EQ(resources.GetPendingSession().GetData()->GetCurrentSession(), "uia");
    EXPECT_FALSE(resources.GetService().IsRegistrationStarted());

    // Creating the account starts the registration. 
    optResult.reset();
    std::ignore = spWizard->CreateAccount("alice", test::Password, test::DeviceName, capture);
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_TRUE(resources.GetService().IsRegistrationStarted());
    EXPECT_TRUE(resources.GetPendingStore().Load()->IsRegistrationStarted());
    {
        auto const body = local::GetLastBody(client);
        EXPECT_EQ(body.at("username").as_string(), "alice");
        EXPECT_EQ(body.at("password").as_string(), test::Password);
        EXPECT_EQ(body.at("initial_device_display_name").as_string(), test::DeviceName);
    }

    optResult.reset();
    client.Script(Method::Post, registerUrl, Status::Unauthorized, test::ContinuedFlows);
    std::ignore = spWizard->PerformReCaptcha("captcha", capture);
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_EQ(local::GetLastBody(client), boost::json::parse(
        R"({"auth":{"type":"m.login.recaptcha","session":"uia","response":"captcha"}})"));
    {
        auto const* const pFlows = std::get_if<Authentication::FlowResult>(
            &std::get<Authentication::RegistrationResult>(*optResult));
        ASSERT_TRUE(pFlows);
        ASSERT_EQ(pFlows->missingStages.size(), std::size_t(1));
        EXPECT_EQ(pFlows->missingStages[0].type, Authentication::Stages::Dummy);
        EXPECT_EQ(pFlows->completedStages, std::vector<std::string>{ std::string{ Authentication::Stages::ReCaptcha } });
    }

    // The final stage produces credentials and the registered session. 
    optResult.reset();
    client.Script(Method::Post, registerUrl, Status::Ok, Test::CreateLoginResponse());
    std::ignore = spWizard->Dummy(capture);
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_EQ(local::GetLastBody(client), boost::json::parse(R"({"auth":{"type":"m.login.dummy","session":"uia"}})"));

    auto const* const pSuccess = std::get_if<Authentication::RegistrationSuccess>(
        &std::get<Authentication::RegistrationResult>(*optResult));
    ASSERT_TRUE(pSuccess);
    ASSERT_TRUE(pSuccess->spSession);
    EXPECT_EQ(pSuccess->spSession->GetSessionId(), Session::CreateSessionId(Test::UserId, Test::DeviceId));
    EXPECT_EQ(resources.GetSessionManager().SessionCount(), std::size_t(1));
    EXPECT_TRUE(resources.GetService().HasAuthenticatedSessions());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RegistrationWizardSuite, ReplacedPendingSessionTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    resources.GetHttpClient().Script(
        Method::Post, local::EndpointUrl(Api::Endpoints::Register), Status::Unauthorized, test::RegistrationFlows);
    resources.GetPendingSession().Set(Test::CreateConfig());

    std::optional<Failure::Expected<Authentication::RegistrationResult>> optResult;
    auto const spWizard = resources.GetService().GetRegistrationWizard();
    std::ignore = spWizard->CreateAccount("alice", test::Password, "", [&] (auto&& result) {
        optResult = std::move(result);
    });

    // The pending session is replaced before the response is delivered on the main context. 
    resources.GetPendingSession().Set(Test::CreateConfig());

    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optResult));
    EXPECT_TRUE(std::holds_alternative<Authentication::FlowResult>(
        std::get<Authentication::RegistrationResult>(*optResult)));

    // The outcome belonged to the replaced session and is not applied to the current one. 
    auto const& optData = resources.GetPendingSession().GetData();
    ASSERT_TRUE(optData);
    EXPECT_FALSE(optData->GetCurrentSession());
    EXPECT_FALSE(optData->IsRegistrationStarted());
    EXPECT_FALSE(resources.GetService().IsRegistrationStarted());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RegistrationWizardSuite, RejectedRegistrationTest)
{
    using namespace Network::Http;
    Test::AuthenticationResources resources;
    resources.GetHttpClient().Script(Method::Post, local::EndpointUrl(Api::Endpoints::Register), 400,
        R"({"errcode":"M_USER_IN_USE","error":"User ID already taken."})");
    resources.GetPendingSession().Set(Test::CreateConfig());

    std::optional<Failure::Expected<Authentication::RegistrationResult>> optResult;
    std::ignore = resources.GetService().GetRegistrationWizard()->CreateAccount("alice", test::Password, "",
        [&] (auto&& result) { optResult = std::move(result); });
    ASSERT_TRUE(resources.RunUntil([&] { return optResult.has_value(); }));
    ASSERT_FALSE(Failure::HasValue(*optResult));

    auto const* const pError = std::get_if<Failure::ServerError>(Failure::GetReason(*optResult));
    ASSERT_TRUE(pError);
    EXPECT_EQ(pError->errcode, "M_USER_IN_USE");
    EXPECT_FALSE(resources.GetService().IsRegistrationStarted());
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::EndpointUrl(std::string_view endpoint)
{
    return Network::Uri::Parse(Test::HomeServerUrl).Resolve(endpoint);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::value local::GetLastBody(Test::HttpClient const& client)
{
    auto const requests = client.GetRequests();
    if (requests.empty() || !requests.back().body) { return {}; }
    return boost::json::parse(*requests.back().body);
}

//----------------------------------------------------------------------------------------------------------------------
