//----------------------------------------------------------------------------------------------------------------------
// File: LoginWizard.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LoginWizard.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Scheduler/Dispatcher.hpp"
#include "Components/Session/Creator.hpp"
#include "Interfaces/Session.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsEmailAddress(std::string_view login);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Type = "type";
constexpr std::string_view Identifier = "identifier";
constexpr std::string_view User = "user";
constexpr std::string_view Medium = "medium";
constexpr std::string_view Address = "address";
constexpr std::string_view Password = "password";
constexpr std::string_view Token = "token";
constexpr std::string_view DeviceName = "initial_device_display_name";

constexpr std::string_view EmailMedium = "email";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Authentication::LoginWizard::LoginWizard(
    std::shared_ptr<Api::Client> const& spClient,
    Configuration::ServerConnectionConfig const& config,
    std::shared_ptr<Scheduler::Dispatcher> const& spDispatcher,
    std::shared_ptr<Session::Creator> const& spCreator)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spClient(spClient)
    , m_config(config)
    , m_spDispatcher(spDispatcher)
    , m_spCreator(spCreator)
{
    assert(m_logger);
    assert(m_spClient && m_spDispatcher && m_spCreator);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::LoginWizard::Login(
    std::string_view login, std::string_view password, std::string_view deviceName, SessionCallback const& callback)
{
    return Perform(CreatePasswordLogin(login, password, deviceName), callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::LoginWizard::LoginWithToken(
    std::string_view token, SessionCallback const& callback)
{
    return Perform(CreateTokenLogin(token), callback);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Authentication::LoginWizard::CreatePasswordLogin(
    std::string_view login, std::string_view password, std::string_view deviceName)
{
    boost::json::object identifier;
    if (local::IsEmailAddress(login)) {
        identifier[symbols::Type] = Identifiers::ThirdParty;
        identifier[symbols::Medium] = symbols::EmailMedium;
        identifier[symbols::Address] = login;
    } else {
        identifier[symbols::Type] = Identifiers::User;
        identifier[symbols::User] = login;
    }

    boost::json::object body;
    body[symbols::Type] = LoginTypes::Password;
    body[symbols::Identifier] = std::move(identifier);
    body[symbols::Password] = password;
    if (!deviceName.empty()) { body[symbols::DeviceName] = deviceName; }
    return body;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Authentication::LoginWizard::CreateTokenLogin(std::string_view token)
{
    boost::json::object body;
    body[symbols::Type] = LoginTypes::Token;
    body[symbols::Token] = token;
    return body;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::LoginWizard::Perform(
    boost::json::object&& body, SessionCallback const& callback)
{
    using Result = Failure::Expected<std::shared_ptr<ISession>>;
    
    auto work = [logger = m_logger, spClient = m_spClient, config = m_config, spCreator = m_spCreator,
        body = std::move(body)] () -> Result
    {
        auto credentials = spClient->Login(body);
        if (auto const* const pReason = Failure::GetReason(credentials); pReason) {
            logger->warn("The homeserver rejected the login. Reason: {}", Failure::ToString(*pReason));
            return *pReason;
        }
        return spCreator->CreateSession(std::get<Credentials>(credentials), config);
    };

    return m_spDispatcher->Launch<Result>(Scheduler::Context::Background, std::move(work), callback);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsEmailAddress(std::string_view login)
{
    return !login.empty() && login.front() != '@' && login.find('@') != std::string_view::npos;
}

//----------------------------------------------------------------------------------------------------------------------
