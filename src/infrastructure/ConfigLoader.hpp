/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading tool defaults from settings.json.
 *
 * Command-line flags take precedence over whatever is loaded here.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "domain/ConflictPolicy.hpp"

namespace dirtree::infrastructure {

/**
 * @struct Settings
 * @brief Defaults for build and scan runs.
 */
struct Settings {
    domain::ConflictPolicy conflictPolicy = domain::ConflictPolicy::Fail;
    bool caseSensitive = true;
    std::vector<std::string> ignorePatterns;
    bool followSymlinks = false;
    std::uintmax_t maxContentBytes = 1024 * 1024;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p configPath.
     * @return Defaults when the file does not exist. A malformed file or value is reported
     *         on stderr and the affected keys keep their defaults.
     */
    static Settings Load(const std::filesystem::path& configPath);
};

} // namespace dirtree::infrastructure
