//----------------------------------------------------------------------------------------------------------------------
// File: Configuration.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Configuration.hpp"
#include "Defaults.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdlib>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultHomeportFolder()
{
    std::filesystem::path filepath = Defaults::FallbackConfigurationFolder;

    // Prefer $XDG_CONFIG_HOME as the configuration directory, otherwise use the user's ~/.config folder. If neither
    // can be found the fallback folder is used. 
    if (auto const systemConfigHomePath = std::getenv("XDG_CONFIG_HOME"); systemConfigHomePath) { 
        filepath = std::string{ systemConfigHomePath };
    } else if (auto const userHomePath = std::getenv("HOME"); userHomePath) {
        filepath = std::filesystem::path{ std::string{ userHomePath } } / ".config";
    }

    return filepath / DefaultHomeportFolder;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultOptionsFilepath()
{
    return GetDefaultHomeportFolder() / DefaultOptionsFilename; // ../homeport/options.json
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultPendingSessionFilepath()
{
    return GetDefaultHomeportFolder() / DefaultPendingSessionFilename; // ../homeport/pending.json
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultSessionsFilepath()
{
    return GetDefaultHomeportFolder() / DefaultSessionsFilename; // ../homeport/sessions.json
}

//----------------------------------------------------------------------------------------------------------------------
