//----------------------------------------------------------------------------------------------------------------------
// File: SessionPersistor.hpp
// Description: Persists the parameters of every authenticated session. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
#include "Components/Session/SessionParams.hpp"
#include "Interfaces/SessionStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class SessionPersistor;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::SessionPersistor : public ISessionStore
{
public:
    using SessionRecords = std::vector<Session::Params>;

    // Note: An empty filepath disables the filesystem, the records are then only held in memory. 
    explicit SessionPersistor(std::filesystem::path const& filepath);

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;

    // Reads the sessions file into memory. A missing file is treated as an empty set of records. 
    StatusCode FetchSessions();
    [[nodiscard]] std::size_t Count() const;

    // ISessionStore {
    [[nodiscard]] virtual std::optional<Session::Params> Get(std::string_view sessionId) const override;
    [[nodiscard]] virtual std::optional<Session::Params> GetLast() const override;
    [[nodiscard]] virtual std::vector<Session::Params> GetAll() const override;

    virtual StatusCode Save(Session::Params const& params) override;
    virtual StatusCode Delete(std::string_view sessionId) override;
    // } ISessionStore

private:
    [[nodiscard]] StatusCode Serialize() const;

    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::filesystem::path m_filepath;
    SessionRecords m_records; // Ordered from the least to the most recently saved. 
};

//----------------------------------------------------------------------------------------------------------------------
