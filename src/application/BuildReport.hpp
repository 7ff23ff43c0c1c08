/**
 * @file BuildReport.hpp
 * @brief Per-node outcome record produced by a build run.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Node.hpp"

namespace dirtree::application {

/**
 * @enum BuildOutcome
 * @brief What happened to one declared node.
 */
enum class BuildOutcome {
    Created,
    Skipped,
    Overwritten,
    Failed
};

inline std::string OutcomeToString(BuildOutcome outcome) {
    switch (outcome) {
        case BuildOutcome::Created: return "created";
        case BuildOutcome::Skipped: return "skipped";
        case BuildOutcome::Overwritten: return "overwritten";
        case BuildOutcome::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @struct BuildEntry
 * @brief Outcome of one node, keyed by its root-relative path (after template expansion).
 */
struct BuildEntry {
    std::string path;
    domain::NodeKind kind = domain::NodeKind::File;
    BuildOutcome outcome = BuildOutcome::Created;
    std::string detail; ///< Reason for Skipped/Failed, empty otherwise.
};

/**
 * @class BuildReport
 * @brief Entries in traversal order plus aggregate counts.
 *
 * Callers decide whether Failed entries make the whole run a failure.
 */
class BuildReport {
public:
    void record(std::string path, domain::NodeKind kind, BuildOutcome outcome, std::string detail = {});

    const std::vector<BuildEntry>& entries() const { return m_entries; }

    std::size_t count(BuildOutcome outcome) const;
    bool hasFailures() const { return count(BuildOutcome::Failed) > 0; }

    bool cancelled() const { return m_cancelled; }
    void markCancelled() { m_cancelled = true; }

    /** @brief Multi-line human readable summary. */
    std::string renderText(bool includeEntries = true) const;

private:
    std::vector<BuildEntry> m_entries;
    std::size_t m_counts[4] = {0, 0, 0, 0};
    bool m_cancelled = false;
};

} // namespace dirtree::application
