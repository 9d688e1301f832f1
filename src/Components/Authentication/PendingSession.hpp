//----------------------------------------------------------------------------------------------------------------------
// File: PendingSession.hpp
// Description: Holds the server configuration produced by discovery until a login or registration completes. The 
// login and registration helpers are built from, and only valid for, the current generation of the pending data. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "PendingSessionData.hpp"
#include "Components/Configuration/ServerConnectionConfig.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

class IClientFactory;
class IPendingSessionStore;

namespace Core { class ServiceProvider; }
namespace Scheduler { class Dispatcher; }
namespace Session { class Creator; }
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Authentication {
//----------------------------------------------------------------------------------------------------------------------

class PendingSession;
class LoginWizard;
class RegistrationWizard;

//----------------------------------------------------------------------------------------------------------------------
} // Authentication namespace
//----------------------------------------------------------------------------------------------------------------------

// Note: The pending session is only accessed from the main context, it does not guard its state. It must be owned by
// a std::shared_ptr such that the helpers it builds may refer back to it. Every write to the store is made on the 
// dispatcher's storage strand, the store always reflects the latest change once the strand has drained. 
class Authentication::PendingSession : public std::enable_shared_from_this<PendingSession>
{
public:
    using Generation = std::uint64_t;
    using Mutator = std::function<void(PendingSessionData& data)>;

    explicit PendingSession(std::shared_ptr<Core::ServiceProvider> const& spServiceProvider);

    PendingSession(PendingSession const&) = delete;
    PendingSession& operator=(PendingSession const&) = delete;

    // Replaces the pending data with a fresh record for the configuration. 
    void Set(Configuration::ServerConnectionConfig const& config);
    void Clear();

    // Applies a helper's progress to the pending data without invalidating the helpers. Throws a StateError if the 
    // generation is no longer current or there is no pending data. 
    void Amend(Generation generation, Mutator const& mutator);

    [[nodiscard]] bool HasData() const;
    [[nodiscard]] std::optional<PendingSessionData> const& GetData() const;
    [[nodiscard]] Generation GetGeneration() const;
    [[nodiscard]] bool IsCurrentGeneration(Generation generation) const;

    // Note: The same helper is returned until the pending data is replaced, cleared, cancelled, or reset. Throws a 
    // StateError if there is no pending data. 
    [[nodiscard]] std::shared_ptr<LoginWizard> GetLoginWizard();
    [[nodiscard]] std::shared_ptr<RegistrationWizard> GetRegistrationWizard();
    [[nodiscard]] bool IsRegistrationStarted() const;

    // Discards the progress of any login or registration, but keeps the server configuration. 
    void Cancel();

    // Discards the pending data entirely. 
    void Reset();

private:
    void Invalidate();
    void Persist() const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IPendingSessionStore> m_spStore;
    std::shared_ptr<IClientFactory> m_spClientFactory;
    std::shared_ptr<Scheduler::Dispatcher> m_spDispatcher;
    std::shared_ptr<Session::Creator> m_spCreator;

    std::optional<PendingSessionData> m_optData;
    Generation m_generation;

    std::shared_ptr<LoginWizard> m_spLoginWizard;
    std::shared_ptr<RegistrationWizard> m_spRegistrationWizard;
};

//----------------------------------------------------------------------------------------------------------------------
