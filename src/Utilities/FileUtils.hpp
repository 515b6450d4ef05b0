//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

// Creates the parent folders of the provided file path, restricted to the owner. Existing folders are left as is.
[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& path)
{
    auto const base = path.has_filename() ? path.parent_path() : path;
    if (base.empty()) { return true; } // A bare filename lives in the working directory.

    std::error_code error;
    if (std::filesystem::exists(base, error)) { return true; }
    if (!std::filesystem::create_directories(base, error) || error) { return false; }

    std::filesystem::permissions(base, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------
