//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The groups of user facing options stored in the options file. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

using StatusResult = std::pair<StatusCode, std::string>;
using DeserializationResult = StatusResult;
using SerializationResult = StatusResult;
using ValidationResult = StatusResult;

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Logging;
class Storage;
class Execution;
class Client;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The options used to configure the core logger.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Logging
{
public:
    static constexpr std::string_view Symbol = "logging";

    Logging();

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] std::optional<std::filesystem::path> const& GetFilepath() const;

    void SetVerbosity(spdlog::level::level_enum verbosity, bool& changed);

private:
    spdlog::level::level_enum m_verbosity;
    std::optional<std::filesystem::path> m_optFilepath;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The options used to locate the pending and authenticated session records. 
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Storage
{
public:
    static constexpr std::string_view Symbol = "storage";

    Storage();

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::optional<std::filesystem::path> const& GetFolder() const;

private:
    std::optional<std::filesystem::path> m_optFolder;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The options used to size the background and computation execution contexts.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Execution
{
public:
    static constexpr std::string_view Symbol = "execution";

    Execution();

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::uint32_t GetBackgroundThreads() const;
    [[nodiscard]] std::uint32_t GetComputationThreads() const;

private:
    std::uint32_t m_backgroundThreads;
    std::uint32_t m_computationThreads;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The options describing this client to the homeserver.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Client
{
public:
    static constexpr std::string_view Symbol = "client";
    static constexpr std::size_t DeviceNameSizeLimit = 256;

    Client();

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetDeviceName() const;
    [[nodiscard]] bool SetDeviceName(std::string_view name, bool& changed);

private:
    std::string m_deviceName;
};

//----------------------------------------------------------------------------------------------------------------------
