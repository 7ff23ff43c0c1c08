/**
 * @file Tree.cpp
 * @brief Validation and traversal for Tree.
 */

#include "domain/Tree.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "domain/TemplateEngine.hpp"
#include "domain/TreeErrors.hpp"

namespace dirtree::domain {

namespace {

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

void Walk(const Node& node, std::vector<std::string>& ancestors, const Tree::Visitor& visitor) {
    for (const auto& child : node.children) {
        visitor(child, ancestors);
        if (child.kind == NodeKind::Directory) {
            ancestors.push_back(child.name);
            Walk(child, ancestors, visitor);
            ancestors.pop_back();
        }
    }
}

} // namespace

Tree::Tree(Node root, VariableMap variables, NameCasePolicy casePolicy)
    : m_root(std::move(root)), m_variables(std::move(variables)), m_casePolicy(casePolicy) {
    if (m_root.kind != NodeKind::Directory) {
        throw StructureError("root node must be a directory, got " + KindToString(m_root.kind));
    }
    validate(m_root, "", true);
}

VariableMap Tree::withVariables(const VariableMap& overrides) const {
    VariableMap merged = m_variables;
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    return merged;
}

void Tree::forEachPreOrder(const Visitor& visitor) const {
    std::vector<std::string> ancestors;
    Walk(m_root, ancestors, visitor);
}

std::size_t Tree::nodeCount() const {
    std::size_t count = 0;
    forEachPreOrder([&count](const Node&, const std::vector<std::string>&) { ++count; });
    return count;
}

void Tree::ValidateName(const std::string& name, const std::string& nodePath) {
    if (name.empty()) {
        throw StructureError("empty name at '" + nodePath + "'");
    }
    if (name == ".") {
        throw StructureError("'.' is not a valid name at '" + nodePath + "'");
    }
    if (name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name.find('\0') != std::string::npos) {
        throw PathSafetyError("name '" + name + "' at '" + nodePath + "' would escape its parent");
    }
}

std::string Tree::NameKey(const std::string& name, NameCasePolicy policy) {
    if (policy == NameCasePolicy::Sensitive) return name;
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
    return key;
}

void Tree::validate(const Node& node, const std::string& nodePath, bool isRoot) const {
    // Templated names are checked again once expanded.
    if (!isRoot && !TemplateEngine::HasPlaceholders(node.name)) {
        ValidateName(node.name, nodePath);
    }

    switch (node.kind) {
        case NodeKind::File:
            if (!node.children.empty()) {
                throw StructureError("file '" + nodePath + "' cannot have children");
            }
            if (node.target) {
                throw StructureError("file '" + nodePath + "' cannot have a link target");
            }
            break;
        case NodeKind::Symlink:
            if (!node.target) {
                throw StructureError("symlink '" + nodePath + "' has no target");
            }
            if (node.content || !node.children.empty()) {
                throw StructureError("symlink '" + nodePath + "' cannot have content or children");
            }
            break;
        case NodeKind::Directory: {
            if (node.content) {
                throw StructureError("directory '" + nodePath + "' cannot have content");
            }
            if (node.target) {
                throw StructureError("directory '" + nodePath + "' cannot have a link target");
            }
            std::unordered_set<std::string> seen;
            for (const auto& child : node.children) {
                std::string childPath = JoinPath(nodePath, child.name);
                if (!seen.insert(NameKey(child.name, m_casePolicy)).second) {
                    throw StructureError("duplicate sibling name '" + childPath + "'");
                }
                validate(child, childPath, false);
            }
            break;
        }
    }
}

bool SameStructure(const Tree& a, const Tree& b) {
    Node left = a.root();
    Node right = b.root();
    left.name.clear();
    right.name.clear();
    return StructurallyEqual(left, right);
}

} // namespace dirtree::domain
