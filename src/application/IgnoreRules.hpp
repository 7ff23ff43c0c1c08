/**
 * @file IgnoreRules.hpp
 * @brief Glob patterns excluding paths from a scan.
 */

#pragma once

#include <string>
#include <vector>

namespace dirtree::application {

/**
 * @class IgnoreRules
 * @brief Matches root-relative paths ('/' separated) against glob patterns.
 *
 * - A pattern without '/' is matched against the entry's basename at any depth.
 * - A pattern containing '/' is matched against the whole relative path; '*' does not cross '/'.
 *   A leading '/' is ignored.
 * - A trailing '/' restricts the pattern to directories.
 */
class IgnoreRules {
public:
    IgnoreRules() = default;
    explicit IgnoreRules(const std::vector<std::string>& patterns);

    void add(const std::string& pattern);

    bool matches(const std::string& relativePath, bool isDirectory) const;

    bool empty() const { return m_rules.empty(); }

private:
    struct Rule {
        std::string pattern;
        bool directoryOnly = false;
        bool anchored = false; ///< Contains '/', matched against the full path.
    };

    std::vector<Rule> m_rules;
};

} // namespace dirtree::application
