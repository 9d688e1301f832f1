//----------------------------------------------------------------------------------------------------------------------
#include "Homeport/Runtime.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Authentication/Service.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Network/Uri.hpp"
#include "Components/Session/Index.hpp"
#include "Tests/Shared/TestHelpers.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

TEST(RuntimeSuite, UnvalidatedOptionsTest)
{
    Configuration::Parser const parser;
    auto const spClientFactory = std::make_shared<Test::ClientFactory>(std::make_shared<Test::HttpClient>());
    auto const spSessionManager = std::make_shared<Test::SessionManager>();
    EXPECT_THROW((Homeport::Runtime{ parser, spClientFactory, spSessionManager }), std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RuntimeSuite, MissingTransportTest)
{
    Configuration::Parser parser;
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_THROW(
        (Homeport::Runtime{ parser, nullptr, std::make_shared<Test::SessionManager>() }), std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RuntimeSuite, InitializeLoggerTest)
{
    Configuration::Parser parser;
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    parser.SetVerbosity(spdlog::level::critical);

    EXPECT_TRUE(Homeport::InitializeLogger(parser));
    auto const spLogger = spdlog::get(Logger::Name.data());
    ASSERT_TRUE(spLogger);
    EXPECT_EQ(spLogger->level(), spdlog::level::critical);

    Logger::SetVerbosity(spdlog::level::off);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(RuntimeSuite, DiscoverAndLoginTest)
{
    using namespace Network::Http;

    // The filesystem is disabled such that the runtime keeps its records in memory. 
    Configuration::Parser parser;
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);

    auto const spHttpClient = std::make_shared<Test::HttpClient>();
    auto const server = Network::Uri::Parse(Test::HomeServerUrl);
    spHttpClient->Script(Method::Get, server.Resolve(Api::Endpoints::Versions), Status::Ok, Test::SupportedVersions);
    spHttpClient->Script(Method::Get, server.Resolve(Api::Endpoints::Login), Status::Ok, Test::PasswordFlows);
    spHttpClient->Script(Method::Post, server.Resolve(Api::Endpoints::Login), Status::Ok, Test::CreateLoginResponse());

    auto const spSessionManager = std::make_shared<Test::SessionManager>();
    Homeport::Runtime runtime{ parser, std::make_shared<Test::ClientFactory>(spHttpClient), spSessionManager };
    EXPECT_TRUE(runtime.GetServiceProvider()->Contains<Session::Index>());

    auto const runUntil = [&runtime] (auto const& predicate) {
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds{ 5 };
        while (!predicate() && std::chrono::steady_clock::now() < deadline) {
            runtime.AwaitTask(std::chrono::milliseconds{ 10 });
            runtime.Execute();
        }
        return predicate();
    };

    auto& service = runtime.GetAuthenticationService();
    EXPECT_FALSE(service.HasAuthenticatedSessions());

    std::optional<Failure::Expected<Discovery::LoginFlowResult>> optFlows;
    std::ignore = service.DiscoverLoginFlow(Test::CreateConfig(), [&] (auto&& result) { optFlows = std::move(result); });
    ASSERT_TRUE(runUntil([&] { return optFlows.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optFlows));
    EXPECT_TRUE(std::holds_alternative<Discovery::LoginFlow::Success>(std::get<Discovery::LoginFlowResult>(*optFlows)));

    std::optional<Failure::Expected<std::shared_ptr<ISession>>> optSession;
    std::ignore = service.GetLoginWizard()->Login(Test::UserId, "password", parser.GetDeviceName(), 
        [&] (auto&& result) { optSession = std::move(result); });
    ASSERT_TRUE(runUntil([&] { return optSession.has_value(); }));
    ASSERT_TRUE(Failure::HasValue(*optSession));

    EXPECT_EQ(spSessionManager->SessionCount(), std::size_t(1));
    EXPECT_TRUE(service.HasAuthenticatedSessions());
    auto const spLast = service.GetLastAuthenticatedSession();
    ASSERT_TRUE(spLast);
    EXPECT_EQ(spLast->GetSessionId(), std::get<std::shared_ptr<ISession>>(*optSession)->GetSessionId());

    runtime.Shutdown();
    runtime.Shutdown();
}

//----------------------------------------------------------------------------------------------------------------------
