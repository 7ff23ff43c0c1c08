/**
 * @file Node.cpp
 * @brief Implementation of Node helpers.
 */

#include "domain/Node.hpp"

#include <algorithm>

namespace dirtree::domain {

Node Node::MakeFile(std::string name, std::optional<std::string> content) {
    Node node;
    node.name = std::move(name);
    node.kind = NodeKind::File;
    node.content = std::move(content);
    return node;
}

Node Node::MakeDirectory(std::string name, std::vector<Node> children) {
    Node node;
    node.name = std::move(name);
    node.kind = NodeKind::Directory;
    node.children = std::move(children);
    return node;
}

Node Node::MakeSymlink(std::string name, std::string target) {
    Node node;
    node.name = std::move(name);
    node.kind = NodeKind::Symlink;
    node.target = std::move(target);
    return node;
}

bool Node::flag(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) return false;
    const bool* value = std::get_if<bool>(&it->second);
    return value && *value;
}

std::string Node::describe() const {
    switch (kind) {
        case NodeKind::File: return "File(" + name + ")";
        case NodeKind::Directory: return "Directory(" + name + ")";
        case NodeKind::Symlink: return "Symlink(" + name + " -> " + target.value_or("") + ")";
    }
    return name;
}

namespace {

bool SameEntry(const Node& a, const Node& b) {
    if (a.kind != b.kind) return false;

    switch (a.kind) {
        case NodeKind::File:
            // An absent content and an empty content produce the same file on disk.
            return a.content.value_or("") == b.content.value_or("");
        case NodeKind::Symlink:
            return a.target == b.target;
        case NodeKind::Directory: {
            if (a.children.size() != b.children.size()) return false;
            for (const auto& child : a.children) {
                auto match = std::find_if(b.children.begin(), b.children.end(),
                    [&child](const Node& other) { return other.name == child.name; });
                if (match == b.children.end() || !SameEntry(child, *match)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

} // namespace

bool StructurallyEqual(const Node& a, const Node& b) {
    return a.name == b.name && SameEntry(a, b);
}

} // namespace dirtree::domain
