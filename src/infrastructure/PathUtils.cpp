#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace dirtree::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "dirtree" / "settings.json";
}

fs::path PathUtils::MakeAbsolute(const fs::path& path) {
    if (path.is_absolute()) return path.lexically_normal();
    return (fs::current_path() / path).lexically_normal();
}

} // namespace dirtree::infrastructure
