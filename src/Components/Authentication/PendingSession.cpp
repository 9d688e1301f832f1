//----------------------------------------------------------------------------------------------------------------------
// File: PendingSession.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PendingSession.hpp"
#include "LoginWizard.hpp"
#include "RegistrationWizard.hpp"
#include "StateError.hpp"
#include "Components/Api/Client.hpp"
#include "Components/Core/ServiceProvider.hpp"
#include "Components/Scheduler/Dispatcher.hpp"
#include "Components/Session/Creator.hpp"
#include "Interfaces/ClientFactory.hpp"
#include "Interfaces/PendingSessionStore.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Authentication::PendingSession::PendingSession(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_spStore(spServiceProvider->Require<IPendingSessionStore>())
    , m_spClientFactory(spServiceProvider->Require<IClientFactory>())
    , m_spDispatcher(spServiceProvider->Require<Scheduler::Dispatcher>())
    , m_spCreator(spServiceProvider->Require<Session::Creator>())
    , m_optData(m_spStore->Load())
    , m_generation(0)
    , m_spLoginWizard()
    , m_spRegistrationWizard()
{
    assert(m_logger);
    if (m_optData) {
        m_logger->debug("Restored a pending session for {}.", m_optData->GetConnectionConfig().GetHomeServerUri().ToString());
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Set(Configuration::ServerConnectionConfig const& config)
{
    m_optData.emplace(config);
    Invalidate();
    Persist();
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Clear()
{
    m_optData.reset();
    Invalidate();
    m_spDispatcher->ExecuteStorage([this] () {
        if (auto const status = m_spStore->Delete(); status != Configuration::StatusCode::Success) {
            m_logger->error("Failed to clear the pending session! Reason: {}", Configuration::StatusCodeToString(status));
        }
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Amend(Generation generation, Mutator const& mutator)
{
    if (!IsCurrentGeneration(generation)) { throw StateError("The pending session has been replaced."); }
    if (!m_optData) { throw StateError("There is no pending session to amend."); }
    mutator(*m_optData);
    Persist();
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::PendingSession::HasData() const { return m_optData.has_value(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Authentication::PendingSessionData> const& Authentication::PendingSession::GetData() const
{
    return m_optData;
}

//----------------------------------------------------------------------------------------------------------------------

Authentication::PendingSession::Generation Authentication::PendingSession::GetGeneration() const
{
    return m_generation;
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::PendingSession::IsCurrentGeneration(Generation generation) const
{
    return generation == m_generation;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Authentication::LoginWizard> Authentication::PendingSession::GetLoginWizard()
{
    if (m_spLoginWizard) { return m_spLoginWizard; }
    if (!m_optData) { throw StateError("A login requires a discovered homeserver."); }

    auto const& config = m_optData->GetConnectionConfig();
    auto const spClient = std::make_shared<Api::Client>(
        m_spClientFactory->BuildClient(config), config.GetHomeServerUri());
    m_spLoginWizard = std::make_shared<LoginWizard>(spClient, config, m_spDispatcher, m_spCreator);
    return m_spLoginWizard;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Authentication::RegistrationWizard> Authentication::PendingSession::GetRegistrationWizard()
{
    if (m_spRegistrationWizard) { return m_spRegistrationWizard; }
    if (!m_optData) { throw StateError("A registration requires a discovered homeserver."); }

    auto const& config = m_optData->GetConnectionConfig();
    auto const spClient = std::make_shared<Api::Client>(
        m_spClientFactory->BuildClient(config), config.GetHomeServerUri());
    m_spRegistrationWizard = std::make_shared<RegistrationWizard>(
        weak_from_this(), m_generation, spClient, config, m_spDispatcher, m_spCreator);
    return m_spRegistrationWizard;
}

//----------------------------------------------------------------------------------------------------------------------

bool Authentication::PendingSession::IsRegistrationStarted() const
{
    return m_spRegistrationWizard && m_spRegistrationWizard->IsRegistrationStarted();
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Cancel()
{
    if (!m_optData) { return; }
    
    m_optData = m_optData->Demote();
    Invalidate();

    m_spDispatcher->PostStorage([logger = m_logger, spStore = m_spStore, data = *m_optData] () {
        if (auto const status = spStore->Save(data); status != Configuration::StatusCode::Success) {
            logger->error(
                "Failed to store the cancelled pending session! Reason: {}", Configuration::StatusCodeToString(status));
        }
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Reset()
{
    m_optData.reset();
    Invalidate();

    m_spDispatcher->PostStorage([logger = m_logger, spStore = m_spStore] () {
        if (auto const status = spStore->Delete(); status != Configuration::StatusCode::Success) {
            logger->error("Failed to remove the pending session! Reason: {}", Configuration::StatusCodeToString(status));
        }
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Invalidate()
{
    ++m_generation;
    m_spLoginWizard.reset();
    m_spRegistrationWizard.reset();
}

//----------------------------------------------------------------------------------------------------------------------

void Authentication::PendingSession::Persist() const
{
    assert(m_optData);
    m_spDispatcher->ExecuteStorage([this] () {
        if (auto const status = m_spStore->Save(*m_optData); status != Configuration::StatusCode::Success) {
            m_logger->error("Failed to store the pending session! Reason: {}", Configuration::StatusCodeToString(status));
        }
    });
}

//----------------------------------------------------------------------------------------------------------------------
