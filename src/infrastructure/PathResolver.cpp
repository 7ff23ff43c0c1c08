#include "infrastructure/PathResolver.hpp"

#include "domain/TreeErrors.hpp"

namespace dirtree::infrastructure {

namespace fs = std::filesystem;
using domain::PathSafetyError;

namespace {

fs::path Normalize(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename; drop it so comparisons line up.
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace

PathResolver::PathResolver(const fs::path& root) {
    if (!root.is_absolute()) {
        throw PathSafetyError("target root '" + root.string() + "' is not absolute");
    }
    m_root = Normalize(root);
}

fs::path PathResolver::Resolve(const std::vector<std::string>& segments) const {
    if (segments.empty()) {
        throw PathSafetyError("empty node path below '" + m_root.string() + "'");
    }

    fs::path result = m_root;
    for (const auto& segment : segments) {
        if (segment.empty() || segment == "." || segment == ".." ||
            segment.find('/') != std::string::npos || segment.find('\\') != std::string::npos ||
            segment.find('\0') != std::string::npos || fs::path(segment).has_root_path()) {
            throw PathSafetyError("segment '" + segment + "' of '" + JoinLogical(segments) +
                                  "' is not a plain entry name");
        }
        result /= segment;
    }

    result = Normalize(result);
    if (result == m_root || !IsBelow(result, m_root)) {
        throw PathSafetyError("'" + JoinLogical(segments) + "' resolves outside '" + m_root.string() + "'");
    }
    return result;
}

void PathResolver::RequireInside(const fs::path& realPath, const fs::path& realRoot, const std::string& origin) {
    fs::path path = Normalize(realPath);
    fs::path root = Normalize(realRoot);
    if (path != root && !IsBelow(path, root)) {
        throw PathSafetyError("'" + origin + "' resolves to '" + path.string() +
                              "' outside '" + root.string() + "'");
    }
}

std::string PathResolver::JoinLogical(const std::vector<std::string>& segments) {
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) joined += '/';
        joined += segment;
    }
    return joined;
}

bool PathResolver::IsBelow(const fs::path& candidate, const fs::path& base) {
    fs::path relative = candidate.lexically_relative(base);
    if (relative.empty() || relative == ".") return false;
    return *relative.begin() != "..";
}

} // namespace dirtree::infrastructure
