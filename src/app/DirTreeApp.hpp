/**
 * @file DirTreeApp.hpp
 * @brief Command-line application class for dirtree.
 */

#pragma once

#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"

namespace dirtree::app {

/**
 * @class DirTreeApp
 * @brief Parses the command line and dispatches to the build or scan direction.
 *
 * Exit codes: 0 success, 1 build finished with failed entries, 2 usage error, fatal error
 * or cancellation.
 */
class DirTreeApp {
public:
    /**
     * @brief Runs one command.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    int RunBuild(const std::vector<std::string>& args);
    int RunScan(const std::vector<std::string>& args);

    /**
     * @brief Loads settings from an explicit --config path or the per-user default.
     */
    infrastructure::Settings LoadSettings(const std::string& explicitPath) const;

    void PrintUsage() const;
};

} // namespace dirtree::app
