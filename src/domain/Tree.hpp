/**
 * @file Tree.hpp
 * @brief Aggregate root: a directory root node plus the template variables.
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "domain/Node.hpp"

namespace dirtree::domain {

using VariableMap = std::map<std::string, std::string>;

/**
 * @enum NameCasePolicy
 * @brief How sibling names are compared for uniqueness. Fixed for the lifetime of a Tree.
 */
enum class NameCasePolicy {
    Sensitive,
    Insensitive
};

/**
 * @class Tree
 * @brief Validated, immutable tree description.
 *
 * Construction throws StructureError (or PathSafetyError for traversal-encoding names)
 * when the node graph violates its invariants. The root's own name is ignored; it stands
 * for the mount point supplied at build or scan time.
 */
class Tree {
public:
    /** @brief Visitor receiving a node and the names of its ancestors below the root. */
    using Visitor = std::function<void(const Node& node, const std::vector<std::string>& ancestors)>;

    explicit Tree(Node root, VariableMap variables = {}, NameCasePolicy casePolicy = NameCasePolicy::Sensitive);

    const Node& root() const { return m_root; }
    const VariableMap& variables() const { return m_variables; }
    NameCasePolicy casePolicy() const { return m_casePolicy; }

    /**
     * @brief Effective variables: the tree's own mapping overlaid by @p overrides.
     */
    VariableMap withVariables(const VariableMap& overrides) const;

    /**
     * @brief Depth-first pre-order walk over every node below the root.
     * Directories are visited before their children, children in declaration order.
     */
    void forEachPreOrder(const Visitor& visitor) const;

    /** @brief Number of nodes below the root. */
    std::size_t nodeCount() const;

    /**
     * @brief Checks a single (already expanded) entry name.
     * @throws StructureError for empty or "." names.
     * @throws PathSafetyError for "..", separators or NUL bytes.
     */
    static void ValidateName(const std::string& name, const std::string& nodePath);

    /** @brief Key used to compare sibling names under @p policy. */
    static std::string NameKey(const std::string& name, NameCasePolicy policy);

private:
    void validate(const Node& node, const std::string& nodePath, bool isRoot) const;

    Node m_root;
    VariableMap m_variables;
    NameCasePolicy m_casePolicy;
};

/**
 * @brief Structural equality of two trees, ignoring root names, metadata and child order.
 */
bool SameStructure(const Tree& a, const Tree& b);

} // namespace dirtree::domain
