/**
 * @file TreeBuilder.hpp
 * @brief Materializes a Tree under a target root, applying the conflict policy.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "application/BuildReport.hpp"
#include "domain/ConflictPolicy.hpp"
#include "domain/FileSystemGateway.hpp"
#include "domain/Tree.hpp"
#include "infrastructure/PathResolver.hpp"

namespace dirtree::application {

/**
 * @struct BuildOptions
 * @brief Per-run settings. The policy is fixed for the whole run.
 */
struct BuildOptions {
    domain::ConflictPolicy policy = domain::ConflictPolicy::Fail;
    const std::atomic<bool>* cancel = nullptr; ///< Checked between nodes when set.
    bool verbose = false;                      ///< Log every node outcome.
};

/**
 * @class TreeBuilder
 * @brief Forward direction: Tree -> filesystem.
 *
 * Nodes are processed pre-order, so a directory exists before any of its children is
 * resolved. StructureError, PathSafetyError and TemplateError always propagate. A
 * ConflictError or IOError propagates under the Fail policy; otherwise it is recorded as a
 * Failed entry and siblings continue. Nothing is rolled back.
 */
class TreeBuilder {
public:
    explicit TreeBuilder(std::shared_ptr<domain::FileSystemGateway> fileSystem);

    /**
     * @brief Builds @p tree below @p rootPath.
     * @param variables Overrides layered over the tree's own variables.
     * @return Outcome of every node below the root.
     */
    BuildReport build(const domain::Tree& tree,
                      const std::filesystem::path& rootPath,
                      const BuildOptions& options,
                      const domain::VariableMap& variables = {});

    /** @brief Report of the last run; still readable after build() threw. */
    const BuildReport& report() const { return m_report; }

private:
    struct Context {
        const domain::Tree& tree;
        const BuildOptions& options;
        domain::VariableMap variables;
        infrastructure::PathResolver resolver;
    };

    std::filesystem::path prepareRoot(const std::filesystem::path& rootPath);
    void buildChildren(Context& ctx, const domain::Node& directory, std::vector<std::string>& segments);
    void buildNode(Context& ctx, const domain::Node& node, std::vector<std::string>& segments,
                   std::unordered_set<std::string>& siblingKeys);
    bool applyExisting(Context& ctx, const domain::Node& node, const domain::EntryStatus& existing,
                       const std::filesystem::path& path, const std::string& logicalPath,
                       const std::string& payload);
    void create(const domain::Node& node, const std::filesystem::path& path, const std::string& payload);
    void skipDescendants(const domain::Node& directory, const std::string& logicalPath, const std::string& reason);
    void record(const BuildOptions& options, const std::string& path, const domain::Node& node,
                BuildOutcome outcome, const std::string& detail = {});
    bool cancelRequested(const BuildOptions& options);

    std::shared_ptr<domain::FileSystemGateway> m_fileSystem;
    BuildReport m_report;
    bool m_stopped = false;
};

} // namespace dirtree::application
