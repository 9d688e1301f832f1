//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes the homeport options file. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    Parser();
    explicit Parser(std::filesystem::path const& filepath);
    ~Parser();

    Parser(Parser const&) = delete;
    Parser& operator=(Parser const&) = delete;

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    void DisableFilesystem();
    [[nodiscard]] bool FilesystemDisabled() const;

    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] std::optional<std::filesystem::path> const& GetLogFilepath() const;
    [[nodiscard]] std::uint32_t GetBackgroundThreads() const;
    [[nodiscard]] std::uint32_t GetComputationThreads() const;
    [[nodiscard]] std::string const& GetDeviceName() const;
    [[nodiscard]] std::filesystem::path GetPendingSessionFilepath() const;
    [[nodiscard]] std::filesystem::path GetSessionsFilepath() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

    void SetVerbosity(spdlog::level::level_enum verbosity);
    [[nodiscard]] bool SetDeviceName(std::string_view name);

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult ValidateOptions();

    [[nodiscard]] std::filesystem::path GetStorageFolder() const;

    std::shared_ptr<spdlog::logger> m_logger;

    std::string m_version;
    std::filesystem::path m_filepath;

    Options::Logging m_logging;
    Options::Storage m_storage;
    Options::Execution m_execution;
    Options::Client m_client;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
