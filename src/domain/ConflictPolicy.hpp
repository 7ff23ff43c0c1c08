/**
 * @file ConflictPolicy.hpp
 * @brief Value Object defining how existing entries are treated during a build.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Node.hpp"

namespace dirtree::domain {

/**
 * @enum ConflictPolicy
 * @brief Chosen once per build run.
 */
enum class ConflictPolicy {
    Fail,       ///< Abort the build at the first existing path.
    Skip,       ///< Leave existing entries alone and do not descend.
    Overwrite,  ///< Rewrite files and links, reuse directories.
    Merge       ///< Like Overwrite, but only rewrite when content differs.
};

/**
 * @enum ConflictAction
 * @brief What the builder must do with a path that already exists.
 */
enum class ConflictAction {
    Abort,             ///< Throw ConflictError for the whole build.
    Skip,              ///< Record Skipped, leave the subtree untouched.
    Rewrite,           ///< Replace the file content or the link.
    RewriteIfChanged,  ///< Compare first, replace only on difference.
    Descend,           ///< Reuse the existing directory and process children.
    KindMismatch       ///< Existing kind differs from the declared one; never coerced.
};

inline std::string PolicyToString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::Fail: return "fail";
        case ConflictPolicy::Skip: return "skip";
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Merge: return "merge";
    }
    return "unknown";
}

inline std::optional<ConflictPolicy> PolicyFromString(const std::string& name) {
    if (name == "fail") return ConflictPolicy::Fail;
    if (name == "skip") return ConflictPolicy::Skip;
    if (name == "overwrite") return ConflictPolicy::Overwrite;
    if (name == "merge") return ConflictPolicy::Merge;
    return std::nullopt;
}

/**
 * @class ConflictResolver
 * @brief Decision table consulted for every declared path that already exists.
 */
class ConflictResolver {
public:
    static ConflictAction Decide(ConflictPolicy policy, NodeKind existing, NodeKind declared) {
        if (policy == ConflictPolicy::Fail) return ConflictAction::Abort;
        // Replacing one kind with another is never done silently.
        if (existing != declared) return ConflictAction::KindMismatch;
        if (policy == ConflictPolicy::Skip) return ConflictAction::Skip;

        if (declared == NodeKind::Directory) return ConflictAction::Descend;
        return policy == ConflictPolicy::Merge ? ConflictAction::RewriteIfChanged
                                               : ConflictAction::Rewrite;
    }
};

} // namespace dirtree::domain
