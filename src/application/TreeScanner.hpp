/**
 * @file TreeScanner.hpp
 * @brief Reconstructs a Tree from an existing directory hierarchy.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "application/IgnoreRules.hpp"
#include "domain/FileSystemGateway.hpp"
#include "domain/Tree.hpp"
#include "infrastructure/PathResolver.hpp"

namespace dirtree::application {

/**
 * @struct ScanOptions
 * @brief Per-run scan settings.
 */
struct ScanOptions {
    bool followSymlinks = false;
    std::uintmax_t maxContentBytes = 1024 * 1024; ///< Larger files are recorded without content.
    bool captureContent = true;
    const std::atomic<bool>* cancel = nullptr;     ///< Checked between entries when set.
    bool verbose = false;
};

/**
 * @class TreeScanner
 * @brief Reverse direction: filesystem -> Tree.
 *
 * Entries are visited pre-order and emitted sorted by name. Ignore rules are applied
 * before descending, so ignored directories are never opened. Symlinks are recorded
 * literally unless followSymlinks is set; followed links must stay inside the root and
 * a link into an already visited directory is recorded as a cycle instead of re-entered.
 * Per-entry read failures are stored in node metadata ("skipped", "error").
 */
class TreeScanner {
public:
    explicit TreeScanner(std::shared_ptr<domain::FileSystemGateway> fileSystem);

    /**
     * @throws PathSafetyError if the root is not absolute or a followed link escapes it.
     * @throws IOError if the root itself cannot be read or is not a directory.
     */
    domain::Tree scan(const std::filesystem::path& rootPath,
                      const IgnoreRules& ignoreRules,
                      const ScanOptions& options = {});

    domain::Tree scan(const std::filesystem::path& rootPath,
                      const std::vector<std::string>& ignorePatterns,
                      const ScanOptions& options = {});

private:
    struct Context {
        const IgnoreRules& rules;
        const ScanOptions& options;
        infrastructure::PathResolver resolver;
        std::filesystem::path realRoot;
        std::set<std::filesystem::path> visited; ///< Real paths of directories already entered.
        bool cancelled = false;
    };

    void scanDirectory(Context& ctx, domain::Node& directory, const std::filesystem::path& directoryPath,
                       std::vector<std::string>& segments);
    bool scanEntry(Context& ctx, domain::Node& node, const std::filesystem::path& path,
                   std::vector<std::string>& segments);
    void scanSymlink(Context& ctx, domain::Node& node, const std::filesystem::path& path,
                     std::vector<std::string>& segments);
    void captureFile(Context& ctx, domain::Node& node, const std::filesystem::path& path,
                     const std::string& relativePath);

    std::shared_ptr<domain::FileSystemGateway> m_fileSystem;
};

} // namespace dirtree::application
