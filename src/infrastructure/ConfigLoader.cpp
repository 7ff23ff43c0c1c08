/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace dirtree::infrastructure {

Settings ConfigLoader::Load(const std::filesystem::path& configPath) {
    Settings settings;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring " << configPath << ": top level is not an object" << std::endl;
        return settings;
    }

    try {
        if (j.contains("conflict_policy")) {
            std::string name = j["conflict_policy"].get<std::string>();
            if (auto policy = domain::PolicyFromString(name)) {
                settings.conflictPolicy = *policy;
            } else {
                std::cerr << "[ConfigLoader] Unknown conflict_policy '" << name << "', using "
                          << domain::PolicyToString(settings.conflictPolicy) << std::endl;
            }
        }
        settings.caseSensitive = j.value("case_sensitive", settings.caseSensitive);
        settings.followSymlinks = j.value("follow_symlinks", settings.followSymlinks);
        settings.maxContentBytes = j.value("max_content_bytes", settings.maxContentBytes);
        if (j.contains("ignore")) {
            settings.ignorePatterns = j["ignore"].get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid value in " << configPath << ": " << e.what() << std::endl;
    }

    return settings;
}

} // namespace dirtree::infrastructure
