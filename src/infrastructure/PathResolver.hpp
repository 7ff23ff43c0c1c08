/**
 * @file PathResolver.hpp
 * @brief Turns logical node paths into safe absolute paths under a target root.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dirtree::infrastructure {

/**
 * @class PathResolver
 * @brief Shared by the builder and the scanner; consulted before every create or read.
 */
class PathResolver {
public:
    /**
     * @param root Absolute target root. Stored lexically normalized.
     * @throws PathSafetyError if @p root is not absolute.
     */
    explicit PathResolver(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return m_root; }

    /**
     * @brief Joins @p segments below the root.
     * @throws PathSafetyError if a segment is empty, ".", "..", absolute or contains a separator,
     *         or if the normalized result is not a strict descendant of the root.
     */
    std::filesystem::path Resolve(const std::vector<std::string>& segments) const;

    /**
     * @brief Escape check for resolved (canonical) paths, e.g. followed symlink targets.
     * @throws PathSafetyError if @p realPath is outside @p realRoot.
     */
    static void RequireInside(const std::filesystem::path& realPath,
                              const std::filesystem::path& realRoot,
                              const std::string& origin);

    /** @brief Root-relative path with '/' separators, as used in reports and ignore rules. */
    static std::string JoinLogical(const std::vector<std::string>& segments);

private:
    static bool IsBelow(const std::filesystem::path& candidate, const std::filesystem::path& base);

    std::filesystem::path m_root;
};

} // namespace dirtree::infrastructure
