//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& path);
[[nodiscard]] std::optional<std::string> ReadBoundedFile(std::filesystem::path const& path, std::uintmax_t limit);
[[nodiscard]] bool WriteFile(std::filesystem::path const& path, std::string_view content);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& path)
{
    auto const filename = (path.has_filename()) ? path.filename() : "";
    auto const base = (!filename.empty()) ? path.parent_path() : path;

    // If the directories exist, there is nothing to do.
    if (base.empty() || std::filesystem::exists(base)) { return true; }
    
    std::error_code error;
    bool const success = std::filesystem::create_directories(base, error);
    if (success) {
        // Credentials may be stored in this folder, only the user should be able to access it. 
        std::filesystem::permissions(base, std::filesystem::perms::owner_all, error);
    }
    
    return success && !error;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::string> FileUtils::ReadBoundedFile(std::filesystem::path const& path, std::uintmax_t limit)
{
    {
        std::error_code error;
        auto const size = std::filesystem::file_size(path, error);
        if (error || size == 0 || size > limit) [[unlikely]] { return {}; }
    }

    std::ifstream reader(path);
    if (reader.fail()) [[unlikely]] { return {}; }

    std::stringstream buffer;
    buffer << reader.rdbuf();
    return buffer.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::WriteFile(std::filesystem::path const& path, std::string_view content)
{
    // Write to a sibling file first such that a failed write never truncates the existing record. 
    auto staging = path;
    staging += ".tmp";

    {
        std::ofstream writer(staging, std::ofstream::out | std::ofstream::trunc);
        if (writer.fail()) [[unlikely]] { return false; }
        writer << content;
        writer.close();
        if (writer.fail()) [[unlikely]] { return false; }
    }

    std::error_code error;
    std::filesystem::rename(staging, path, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------
