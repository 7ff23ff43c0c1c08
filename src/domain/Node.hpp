/**
 * @file Node.hpp
 * @brief Domain entity representing one filesystem entry of a declarative tree.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dirtree::domain {

/**
 * @enum NodeKind
 * @brief Closed set of entry kinds. Traversal code switches on it exhaustively.
 */
enum class NodeKind {
    File,
    Directory,
    Symlink
};

/** @brief Scalar metadata value. Opaque to the core, passed through unchanged. */
using MetadataValue = std::variant<bool, std::int64_t, double, std::string>;
using Metadata = std::map<std::string, MetadataValue>;

/**
 * @brief Helper to convert kind to its description-format name.
 */
inline std::string KindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::File: return "file";
        case NodeKind::Directory: return "directory";
        case NodeKind::Symlink: return "symlink";
    }
    return "unknown";
}

/**
 * @brief Parses a description-format kind name.
 * @return nullopt for an unknown name.
 */
inline std::optional<NodeKind> KindFromString(const std::string& name) {
    if (name == "file") return NodeKind::File;
    if (name == "directory") return NodeKind::Directory;
    if (name == "symlink") return NodeKind::Symlink;
    return std::nullopt;
}

/**
 * @class Node
 * @brief One file, directory or symlink. Children are owned by value, so the graph is a strict tree.
 */
class Node {
public:
    std::string name;
    NodeKind kind = NodeKind::File;
    std::optional<std::string> content;   ///< File only. Absent means "create empty file".
    std::optional<std::string> target;    ///< Symlink only. Literal link text, never resolved at build time.
    std::vector<Node> children;           ///< Directory only, in declaration order.
    Metadata metadata;

    Node() = default;

    static Node MakeFile(std::string name, std::optional<std::string> content = std::nullopt);
    static Node MakeDirectory(std::string name, std::vector<Node> children = {});
    static Node MakeSymlink(std::string name, std::string target);

    /** @brief Metadata flag lookup; false when absent or not a bool. */
    bool flag(const std::string& key) const;

    /** @brief Short label for log lines, e.g. "Directory(src)". */
    std::string describe() const;
};

/**
 * @brief Compares names, kinds, content, targets and, for directories, the set of children.
 * Metadata is ignored. Child order does not matter.
 */
bool StructurallyEqual(const Node& a, const Node& b);

} // namespace dirtree::domain
