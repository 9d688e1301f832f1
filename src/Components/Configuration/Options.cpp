//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string CreateMismatchedValueTypeMessage(
    std::string_view expected, std::string_view group, std::string_view field);
[[nodiscard]] std::string CreateInvalidValueMessage(std::string_view group, std::string_view field);

[[nodiscard]] Configuration::DeserializationResult ReadThreadCount(
    boost::json::object const& json, std::string_view group, std::string_view field, std::uint32_t& count);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Verbosity = "verbosity";
constexpr std::string_view File = "file";
constexpr std::string_view Folder = "folder";
constexpr std::string_view BackgroundThreads = "background_threads";
constexpr std::string_view ComputationThreads = "computation_threads";
constexpr std::string_view DeviceName = "device_name";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Configuration::Options::Logging {
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Logging::Logging()
    : m_verbosity(Logger::ParseVerbosity(Defaults::Verbosity).value_or(spdlog::level::info))
    , m_optFilepath()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Logging::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "logging": {
    //     "verbosity": String,
    //     "file": Optional String
    // },
    if (auto const itr = json.find(symbols::Verbosity); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, local::CreateMismatchedValueTypeMessage("string", Symbol, symbols::Verbosity) };
        }

        auto const optVerbosity = Logger::ParseVerbosity(itr->value().get_string());
        if (!optVerbosity) {
            return { StatusCode::DecodeError, local::CreateInvalidValueMessage(Symbol, symbols::Verbosity) };
        }
        m_verbosity = *optVerbosity;
    }

    if (auto const itr = json.find(symbols::File); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, local::CreateMismatchedValueTypeMessage("string", Symbol, symbols::File) };
        }
        std::string_view const file = itr->value().get_string();
        if (!file.empty()) { m_optFilepath = std::filesystem::path{ std::string{ file } }; }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Logging::Write(boost::json::object& json) const
{
    boost::json::object group;
    auto const verbosity = spdlog::level::to_string_view(m_verbosity);
    group[symbols::Verbosity] = std::string_view{ verbosity.data(), verbosity.size() };
    if (m_optFilepath) { group[symbols::File] = m_optFilepath->string(); }
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Logging::AreOptionsAllowable() const
{
    if (m_optFilepath && !m_optFilepath->has_filename()) {
        return { StatusCode::InputError, local::CreateInvalidValueMessage(Symbol, symbols::File) };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Configuration::Options::Logging::GetVerbosity() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Configuration::Options::Logging::GetFilepath() const
{
    return m_optFilepath;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Logging::SetVerbosity(spdlog::level::level_enum verbosity, bool& changed)
{
    changed = (m_verbosity != verbosity);
    m_verbosity = verbosity;
}

//----------------------------------------------------------------------------------------------------------------------
// } Configuration::Options::Logging
//----------------------------------------------------------------------------------------------------------------------
// Configuration::Options::Storage {
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Storage::Storage()
    : m_optFolder()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Storage::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "storage": {
    //     "folder": Optional String
    // },
    if (auto const itr = json.find(symbols::Folder); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, local::CreateMismatchedValueTypeMessage("string", Symbol, symbols::Folder) };
        }
        std::string_view const folder = itr->value().get_string();
        if (!folder.empty()) { m_optFolder = std::filesystem::path{ std::string{ folder } }; }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Storage::Write(boost::json::object& json) const
{
    boost::json::object group;
    if (m_optFolder) { group[symbols::Folder] = m_optFolder->string(); }
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Storage::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" }; // There are no requirements for this set of options. 
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Configuration::Options::Storage::GetFolder() const { return m_optFolder; }

//----------------------------------------------------------------------------------------------------------------------
// } Configuration::Options::Storage
//----------------------------------------------------------------------------------------------------------------------
// Configuration::Options::Execution {
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Execution::Execution()
    : m_backgroundThreads(Defaults::BackgroundThreads)
    , m_computationThreads(Defaults::ComputationThreads)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Execution::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "execution": {
    //     "background_threads": Integer,
    //     "computation_threads": Integer
    // },
    if (auto const result = local::ReadThreadCount(json, Symbol, symbols::BackgroundThreads, m_backgroundThreads);
        result.first != StatusCode::Success) {
        return result;
    }

    return local::ReadThreadCount(json, Symbol, symbols::ComputationThreads, m_computationThreads);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Execution::Write(boost::json::object& json) const
{
    boost::json::object group;
    group[symbols::BackgroundThreads] = m_backgroundThreads;
    group[symbols::ComputationThreads] = m_computationThreads;
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Execution::AreOptionsAllowable() const
{
    constexpr auto IsAllowable = [] (std::uint32_t count) { return count != 0 && count <= Defaults::ThreadLimit; };
    if (!IsAllowable(m_backgroundThreads)) {
        return { StatusCode::InputError, local::CreateInvalidValueMessage(Symbol, symbols::BackgroundThreads) };
    }
    if (!IsAllowable(m_computationThreads)) {
        return { StatusCode::InputError, local::CreateInvalidValueMessage(Symbol, symbols::ComputationThreads) };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Execution::GetBackgroundThreads() const { return m_backgroundThreads; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Configuration::Options::Execution::GetComputationThreads() const { return m_computationThreads; }

//----------------------------------------------------------------------------------------------------------------------
// } Configuration::Options::Execution
//----------------------------------------------------------------------------------------------------------------------
// Configuration::Options::Client {
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Client::Client()
    : m_deviceName(Defaults::DeviceName)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Client::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "client": {
    //     "device_name": String
    // },
    if (auto const itr = json.find(symbols::DeviceName); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, local::CreateMismatchedValueTypeMessage("string", Symbol, symbols::DeviceName) };
        }
        m_deviceName = itr->value().get_string();
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Client::Write(boost::json::object& json) const
{
    boost::json::object group;
    group[symbols::DeviceName] = m_deviceName;
    json.emplace(Symbol, std::move(group));
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Client::AreOptionsAllowable() const
{
    if (m_deviceName.empty() || m_deviceName.size() > DeviceNameSizeLimit) {
        return { StatusCode::InputError, local::CreateInvalidValueMessage(Symbol, symbols::DeviceName) };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Client::GetDeviceName() const { return m_deviceName; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Client::SetDeviceName(std::string_view name, bool& changed)
{
    if (name.empty() || name.size() > DeviceNameSizeLimit) { return false; }
    changed = (m_deviceName != name);
    m_deviceName = name;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
// } Configuration::Options::Client
//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateMismatchedValueTypeMessage(
    std::string_view expected, std::string_view group, std::string_view field)
{
    std::ostringstream oss;
    oss << "Expected " << expected << " value for \"" << group << "." << field << "\".";
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateInvalidValueMessage(std::string_view group, std::string_view field)
{
    std::ostringstream oss;
    oss << "Invalid value provided for \"" << group << "." << field << "\".";
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult local::ReadThreadCount(
    boost::json::object const& json, std::string_view group, std::string_view field, std::uint32_t& count)
{
    using Configuration::StatusCode;
    auto const itr = json.find(field);
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    auto const& value = itr->value();
    if (value.is_uint64() && value.get_uint64() <= std::numeric_limits<std::uint32_t>::max()) {
        count = static_cast<std::uint32_t>(value.get_uint64());
    } else if (value.is_int64() && value.get_int64() >= 0 && value.get_int64() <= std::numeric_limits<std::uint32_t>::max()) {
        count = static_cast<std::uint32_t>(value.get_int64());
    } else {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("unsigned integer", group, field) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
