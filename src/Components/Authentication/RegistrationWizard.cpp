//----------------------------------------------------------------------------------------------------------------------
// File: RegistrationWizard.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "RegistrationWizard.hpp"
#include "PendingSession.hpp"
#include "StateError.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Scheduler/Dispatcher.hpp"
#include "Components/Session/Creator.hpp"
#include "Interfaces/Session.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// The result of a registration request as observed from the background context. Credentials have already been 
// turned into a session, a flow response still needs to be applied to the pending session. 
using Attempt = Failure::Expected<std::variant<std::shared_ptr<ISession>, Authentication::FlowResponse>>;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Auth = "auth";
constexpr std::string_view Type = "type";
constexpr std::string_view Session = "session";
constexpr std::string_view Response = "response";
constexpr std::string_view Username = "username";
constexpr std::string_view Password = "password";
constexpr std::string_view DeviceName = "initial_device_display_name";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Authentication::RegistrationWizard::RegistrationWizard(
    std::weak_ptr<PendingSession> const& wpPendingSession,
    std::uint64_t generation,
    std::shared_ptr<Api::Client> const& spClient,
    Configuration::ServerConnectionConfig const& config,
    std::shared_ptr<Scheduler::Dispatcher> const& spDispatcher,
    std::shared_ptr<Session::Creator> const& spCreator)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_wpPendingSession(wpPendingSession)
    , m_generation(generation)
    , m_spClient(spClient)
    , m_config(config)
    , m_spDispatcher(spDispatcher)
    , m_spCreator(spCreator)
{
    assert(m_logger);
    assert(m_spClient && m_spDispatcher && m_spCreator);
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::RegistrationWizard::IsRegistrationStarted() const
{
    auto const spPendingSession = m_wpPendingSession.lock();
    if (!spPendingSession || !spPendingSession->IsCurrentGeneration(m_generation)) { return false; }
    auto const& optData = spPendingSession->GetData();
    return optData && optData->IsRegistrationStarted();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Authentication::RegistrationWizard::GetCurrentSession() const
{
    auto const spPendingSession = m_wpPendingSession.lock();
    if (!spPendingSession || !spPendingSession->IsCurrentGeneration(m_generation)) { return {}; }
    auto const& optData = spPendingSession->GetData();
    if (!optData) { return {}; }
    return optData->GetCurrentSession();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::FetchRegistrationFlow(
    RegistrationCallback const& callback)
{
    return Perform(boost::json::object{}, false, callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::CreateAccount(
    std::string_view username, std::string_view password, std::string_view deviceName, RegistrationCallback const& callback)
{
    boost::json::object body;
    body[symbols::Username] = username;
    body[symbols::Password] = password;
    if (!deviceName.empty()) { body[symbols::DeviceName] = deviceName; }
    return Perform(std::move(body), true, callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::PerformReCaptcha(
    std::string_view response, RegistrationCallback const& callback)
{
    auto body = CreateStageBody(Stages::ReCaptcha);
    body[symbols::Auth].as_object()[symbols::Response] = response;
    return Perform(std::move(body), false, callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::AcceptTerms(
    RegistrationCallback const& callback)
{
    return Perform(CreateStageBody(Stages::Terms), false, callback);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::Dummy(RegistrationCallback const& callback)
{
    return Perform(CreateStageBody(Stages::Dummy), false, callback);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Authentication::RegistrationWizard::CreateStageBody(std::string_view type) const
{
    auto const optSession = GetCurrentSession();
    if (!optSession) { throw StateError("The registration has not been started by the homeserver."); }

    boost::json::object auth;
    auth[symbols::Type] = type;
    auth[symbols::Session] = *optSession;

    boost::json::object body;
    body[symbols::Auth] = std::move(auth);
    return body;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Cancelable> Authentication::RegistrationWizard::Perform(
    boost::json::object&& body, bool startsRegistration, RegistrationCallback const& callback)
{
    auto work = [logger = m_logger, spClient = m_spClient, config = m_config, spCreator = m_spCreator,
        body = std::move(body)] () -> local::Attempt
    {
        auto response = spClient->Register(body);
        if (auto const* const pReason = Failure::GetReason(response); pReason) {
            logger->warn("The homeserver rejected the registration. Reason: {}", Failure::ToString(*pReason));
            return *pReason;
        }

        return std::visit(VariantVisitor{
            [&] (Credentials const& credentials) -> local::Attempt {
                return spCreator->CreateSession(credentials, config);
            },
            [] (FlowResponse const& flows) -> local::Attempt { return flows; },
        }, std::get<Api::RegistrationResponse>(response));
    };

    auto complete = [wpPendingSession = m_wpPendingSession, generation = m_generation, startsRegistration, callback] (
        local::Attempt&& attempt)
    {
        if (auto const* const pReason = Failure::GetReason(attempt); pReason) {
            callback(Failure::Reason{ *pReason });
            return;
        }

        auto& outcome = std::get<0>(attempt);
        auto const* const pFlows = std::get_if<FlowResponse>(&outcome);

        // The pending session may have been replaced while the request was in flight. The outcome is still delivered,
        // but it must not be applied to a different homeserver's registration. 
        if (auto const spPendingSession = wpPendingSession.lock(); spPendingSession) {
            if (spPendingSession->IsCurrentGeneration(generation) && spPendingSession->HasData()) {
                spPendingSession->Amend(generation, [&] (PendingSessionData& data) {
                    if (pFlows && pFlows->session) { data.SetCurrentSession(pFlows->session); }
                    if (startsRegistration) { data.SetRegistrationStarted(true); }
                });
            }
        }

        if (pFlows) {
            callback(RegistrationResult{ FlowResult::Create(*pFlows) });
        } else {
            callback(RegistrationResult{ RegistrationSuccess{ std::get<std::shared_ptr<ISession>>(outcome) } });
        }
    };

    return m_spDispatcher->Launch<local::Attempt>(Scheduler::Context::Background, std::move(work), std::move(complete));
}

//----------------------------------------------------------------------------------------------------------------------
