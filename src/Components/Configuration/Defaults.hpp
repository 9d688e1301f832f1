//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";

constexpr std::uintmax_t FileSizeLimit = 12'000; // Limit the options file to 12KB
constexpr std::uintmax_t RecordSizeLimit = 1024 * 1024; // Limit the session records to 1 MiB

#if !defined(WIN32)
std::filesystem::path const FallbackConfigurationFolder = "/etc/";
#endif

constexpr std::string_view Verbosity = "info";

constexpr std::uint32_t BackgroundThreads = 2;
constexpr std::uint32_t ComputationThreads = 1;
constexpr std::uint32_t ThreadLimit = 16;

constexpr std::string_view DeviceName = "Homeport";

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
