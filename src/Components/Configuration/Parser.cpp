//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp 
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Configuration.hpp"
#include "Defaults.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename GroupType>
[[nodiscard]] Configuration::DeserializationResult MergeGroup(boost::json::object const& json, GroupType& group);

[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view expected, std::string_view field);
[[nodiscard]] std::string CreateMissingFieldMessage(std::string_view field);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "version";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. 
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "logging": {
//     "verbosity": String,
//     "file": Optional String
// },
// "storage": {
//     "folder": Optional String
// },
// "execution": {
//     "background_threads": Integer,
//     "computation_threads": Integer
// },
// "client": {
//     "device_name": String
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser()
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_version(Defaults::Version)
    , m_filepath()
    , m_logging()
    , m_storage()
    , m_execution()
    , m_client()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : Parser()
{
    m_filepath = filepath;
    if (!m_filepath.has_filename()) { m_filepath /= DefaultOptionsFilename; }

    if (!FileUtils::CreateFolderIfNoneExist(m_filepath)) {
        m_logger->error("Failed to create the filepath at: {}!", m_filepath.string());
        DisableFilesystem(); // If we failed to create the filepath, we are unable to use the filesystem. 
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::~Parser()
{
    if (!m_filepath.empty() && m_changed) {
        if (auto const status = Serialize(); status.first != StatusCode::Success) {
            m_logger->warn("Failed to flush pending option changes! Reason: {}", status.second);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; } 
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // Update the options file as the initialization of options may create new values for certain fields.
    auto const status = Serialize(); 
    if (status.first != StatusCode::Success) {
        m_logger->error("Failed to update the options file at: {}! Reason: {}", m_filepath.string(), status.second);
    }

    return status;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (m_changed || !m_validated) {
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
    }

    // If the filesystem is disabled, there is nothing to do.
    if (m_filepath.empty()) {
        m_changed = false;
        return { StatusCode::Success, "" };
    }

    boost::json::object json;
    json[symbols::Version] = m_version;

    if (auto const status = m_logging.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_storage.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_execution.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_client.Write(json); status.first != StatusCode::Success) { return status; } 

    if (!FileUtils::WriteFile(m_filepath, JSON::ToPrettyString(json))) {
        return { StatusCode::FileError, "Failed to write the options file." };
    }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed. 
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::DisableFilesystem() { m_filepath.clear(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::FilesystemDisabled() const { return m_filepath.empty(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version; }

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Parser::GetVerbosity() const { return m_logging.GetVerbosity(); }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Configuration::Parser::GetLogFilepath() const
{
    return m_logging.GetFilepath();
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Parser::GetBackgroundThreads() const { return m_execution.GetBackgroundThreads(); }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Parser::GetComputationThreads() const { return m_execution.GetComputationThreads(); }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetDeviceName() const { return m_client.GetDeviceName(); }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetPendingSessionFilepath() const
{
    if (m_filepath.empty()) { return {}; } // An empty path disables the session records too. 
    return GetStorageFolder() / DefaultPendingSessionFilename;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetSessionsFilepath() const
{
    if (m_filepath.empty()) { return {}; }
    return GetStorageFolder() / DefaultSessionsFilename;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetVerbosity(spdlog::level::level_enum verbosity)
{
    bool changed = false;
    m_logging.SetVerbosity(verbosity, changed);
    m_changed |= changed;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::SetDeviceName(std::string_view name)
{
    bool changed = false;
    bool const success = m_client.SetDeviceName(name, changed);
    m_changed |= changed;
    return success;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; } // If filesystem usage is disabled, there is nothing to do.
    if (m_validated && !m_changed) { return { StatusCode::Success, "" }; } // If there are no changes, there is nothing to do.

    if (std::filesystem::exists(m_filepath)) {
        m_logger->debug("Reading the options file at: {}.", m_filepath.string());
        return Deserialize();
    }

    // A missing options file is generated from the defaults on the following serialization. 
    m_logger->info("No options file found at: {}. Generating one from the defaults.", m_filepath.string());
    m_changed = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    if (m_filepath.empty()) { return { StatusCode::Success, "" }; }

    auto const optSerialized = FileUtils::ReadBoundedFile(m_filepath, Defaults::FileSizeLimit);
    if (!optSerialized) {
        return { StatusCode::FileError, "Failed to read the options file or it exceeded the size limit." };
    }

    constexpr boost::json::parse_options ParserOptions{
        .allow_comments = true,
        .allow_trailing_commas = true,
    };

    boost::json::error_code error;
    auto const value = boost::json::parse(*optSerialized, error, boost::json::storage_ptr{}, ParserOptions);
    if (error || !value.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the options file as a valid JSON object." };
    }

    auto const& json = value.get_object();
    if (auto const itr = json.find(symbols::Version); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, local::CreateMismatchedValueTypeMessage("string", symbols::Version) };
        }
        m_version = itr->value().get_string();
    } else {
        return { StatusCode::DecodeError, local::CreateMissingFieldMessage(symbols::Version) };
    }

    if (auto const status = local::MergeGroup(json, m_logging); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeGroup(json, m_storage); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeGroup(json, m_execution); status.first != StatusCode::Success) { return status; }
    if (auto const status = local::MergeGroup(json, m_client); status.first != StatusCode::Success) { return status; }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails. 

    if (auto const status = m_logging.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_storage.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_execution.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_client.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetStorageFolder() const
{
    if (auto const& optFolder = m_storage.GetFolder(); optFolder) { return *optFolder; }
    return m_filepath.parent_path();
}

//----------------------------------------------------------------------------------------------------------------------

template<typename GroupType>
Configuration::DeserializationResult local::MergeGroup(boost::json::object const& json, GroupType& group)
{
    using Configuration::StatusCode;
    auto const itr = json.find(GroupType::Symbol);
    if (itr == json.end()) { return { StatusCode::Success, "" }; } // Missing groups retain their defaults. 
    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", GroupType::Symbol) };
    }
    return group.Merge(itr->value().get_object());
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateMismatchedValueTypeMessage(std::string_view expected, std::string_view field)
{
    std::ostringstream oss;
    oss << "Expected " << expected << " value for \"" << field << "\".";
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateMissingFieldMessage(std::string_view field)
{
    std::ostringstream oss;
    oss << "The required field \"" << field << "\" is missing.";
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
