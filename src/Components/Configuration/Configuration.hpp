//----------------------------------------------------------------------------------------------------------------------
// File: Configuration.hpp
// Description: Locations of the files the library reads and writes. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const DefaultHomeportFolder = "homeport";
std::filesystem::path const DefaultOptionsFilename = "options.json";
std::filesystem::path const DefaultPendingSessionFilename = "pending.json";
std::filesystem::path const DefaultSessionsFilename = "sessions.json";

[[nodiscard]] std::filesystem::path GetDefaultHomeportFolder();
[[nodiscard]] std::filesystem::path GetDefaultOptionsFilepath();
[[nodiscard]] std::filesystem::path GetDefaultPendingSessionFilepath();
[[nodiscard]] std::filesystem::path GetDefaultSessionsFilepath();

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
