//----------------------------------------------------------------------------------------------------------------------
// File: PendingSessionPersistor.hpp
// Description: Persists the login or registration that is currently in progress. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
#include "Components/Authentication/PendingSessionData.hpp"
#include "Interfaces/PendingSessionStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class PendingSessionPersistor;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::PendingSessionPersistor : public IPendingSessionStore
{
public:
    // Note: An empty filepath disables the filesystem, the record is then only held in memory. 
    explicit PendingSessionPersistor(std::filesystem::path const& filepath);

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;

    // IPendingSessionStore {
    [[nodiscard]] virtual std::optional<Authentication::PendingSessionData> Load() const override;
    virtual StatusCode Save(Authentication::PendingSessionData const& data) override;
    virtual StatusCode Delete() override;
    // } IPendingSessionStore

private:
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::filesystem::path m_filepath;
    std::optional<Authentication::PendingSessionData> m_optCached;
};

//----------------------------------------------------------------------------------------------------------------------
