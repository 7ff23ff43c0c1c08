// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace dirtree::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief Absolute, lexically normalized form of @p path (relative paths resolve against the cwd). */
    static std::filesystem::path MakeAbsolute(const std::filesystem::path& path);
};

} // namespace dirtree::infrastructure
