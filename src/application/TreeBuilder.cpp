/**
 * @file TreeBuilder.cpp
 * @brief Implementation of TreeBuilder.
 */

#include "application/TreeBuilder.hpp"

#include <iostream>
#include <limits>

#include "domain/TemplateEngine.hpp"
#include "domain/TreeErrors.hpp"

namespace dirtree::application {

namespace fs = std::filesystem;
using domain::ConflictAction;
using domain::ConflictError;
using domain::ConflictPolicy;
using domain::ConflictResolver;
using domain::IOError;
using domain::Node;
using domain::NodeKind;
using domain::TemplateEngine;
using infrastructure::PathResolver;

namespace {

std::string JoinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

std::string MismatchMessage(const domain::EntryStatus& existing, NodeKind declared) {
    std::string found = existing.regular ? domain::KindToString(existing.kind) : "special file";
    return "existing " + found + " where a " + domain::KindToString(declared) + " is declared";
}

} // namespace

TreeBuilder::TreeBuilder(std::shared_ptr<domain::FileSystemGateway> fileSystem)
    : m_fileSystem(std::move(fileSystem)) {}

BuildReport TreeBuilder::build(const domain::Tree& tree,
                               const fs::path& rootPath,
                               const BuildOptions& options,
                               const domain::VariableMap& variables) {
    m_report = BuildReport();
    m_stopped = false;

    // Validates the root before anything is created.
    PathResolver requested(rootPath);
    fs::path realRoot = prepareRoot(requested.root());

    Context ctx{tree, options, tree.withVariables(variables), PathResolver(realRoot)};
    std::vector<std::string> segments;
    buildChildren(ctx, tree.root(), segments);

    if (options.verbose) {
        std::cout << "[Builder] " << m_report.renderText(false);
    }
    return m_report;
}

fs::path TreeBuilder::prepareRoot(const fs::path& rootPath) {
    std::vector<fs::path> missing;
    fs::path cursor = rootPath;
    while (!m_fileSystem->status(cursor)) {
        missing.push_back(cursor);
        if (cursor == cursor.root_path()) break;
        cursor = cursor.parent_path();
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        m_fileSystem->createDirectory(*it);
    }
    if (!missing.empty()) {
        std::cout << "[Builder] Created target root " << rootPath << std::endl;
    }

    fs::path realRoot = m_fileSystem->canonical(rootPath);
    auto status = m_fileSystem->status(realRoot);
    if (!status || status->kind != NodeKind::Directory) {
        throw ConflictError(rootPath.string(), "target root is not a directory");
    }
    return realRoot;
}

void TreeBuilder::buildChildren(Context& ctx, const Node& directory, std::vector<std::string>& segments) {
    // Keys of expanded names; templates can make two declared names collide.
    std::unordered_set<std::string> siblingKeys;
    for (const auto& child : directory.children) {
        if (m_stopped || cancelRequested(ctx.options)) return;
        buildNode(ctx, child, segments, siblingKeys);
    }
}

void TreeBuilder::buildNode(Context& ctx, const Node& node, std::vector<std::string>& segments,
                            std::unordered_set<std::string>& siblingKeys) {
    const std::string declaredPath = JoinPath(PathResolver::JoinLogical(segments), node.name);

    std::string name = node.name;
    if (TemplateEngine::HasPlaceholders(name)) {
        name = TemplateEngine::Expand(name, ctx.variables, declaredPath);
    }
    domain::Tree::ValidateName(name, declaredPath);
    if (!siblingKeys.insert(domain::Tree::NameKey(name, ctx.tree.casePolicy())).second) {
        throw domain::StructureError("duplicate sibling name '" + JoinPath(PathResolver::JoinLogical(segments), name) +
                                     "' after template expansion");
    }

    segments.push_back(name);
    const fs::path path = ctx.resolver.Resolve(segments);
    const std::string logicalPath = PathResolver::JoinLogical(segments);

    std::string payload;
    if (node.kind == NodeKind::File) {
        payload = node.content.value_or("");
        if (!node.flag("verbatim") && TemplateEngine::HasPlaceholders(payload)) {
            payload = TemplateEngine::Expand(payload, ctx.variables, logicalPath);
        }
    } else if (node.kind == NodeKind::Symlink) {
        payload = node.target.value_or("");
        if (TemplateEngine::HasPlaceholders(payload)) {
            payload = TemplateEngine::Expand(payload, ctx.variables, logicalPath);
        }
    }

    bool descend = false;
    try {
        auto existing = m_fileSystem->status(path);
        if (!existing) {
            create(node, path, payload);
            record(ctx.options, logicalPath, node, BuildOutcome::Created);
            descend = node.kind == NodeKind::Directory;
        } else {
            descend = applyExisting(ctx, node, *existing, path, logicalPath, payload);
        }
    } catch (const IOError& e) {
        record(ctx.options, logicalPath, node, BuildOutcome::Failed, e.what());
        if (ctx.options.policy == ConflictPolicy::Fail) throw;
        skipDescendants(node, logicalPath, "ancestor failed");
    }

    if (descend) {
        buildChildren(ctx, node, segments);
    }
    segments.pop_back();
}

bool TreeBuilder::applyExisting(Context& ctx, const Node& node, const domain::EntryStatus& existing,
                                const fs::path& path, const std::string& logicalPath,
                                const std::string& payload) {
    ConflictAction action = existing.regular
        ? ConflictResolver::Decide(ctx.options.policy, existing.kind, node.kind)
        : (ctx.options.policy == ConflictPolicy::Fail ? ConflictAction::Abort : ConflictAction::KindMismatch);

    switch (action) {
        case ConflictAction::Abort: {
            ConflictError error(logicalPath, "path already exists");
            record(ctx.options, logicalPath, node, BuildOutcome::Failed, error.what());
            throw error;
        }

        case ConflictAction::KindMismatch: {
            ConflictError error(logicalPath, MismatchMessage(existing, node.kind));
            record(ctx.options, logicalPath, node, BuildOutcome::Failed, error.what());
            skipDescendants(node, logicalPath, "ancestor failed");
            return false;
        }

        case ConflictAction::Skip:
            record(ctx.options, logicalPath, node, BuildOutcome::Skipped, "already exists");
            skipDescendants(node, logicalPath, "ancestor skipped");
            return false;

        case ConflictAction::Descend:
            record(ctx.options, logicalPath, node, BuildOutcome::Skipped, "existing directory reused");
            return true;

        case ConflictAction::RewriteIfChanged: {
            bool same = false;
            if (node.kind == NodeKind::File) {
                auto current = m_fileSystem->readFile(path, std::numeric_limits<std::uintmax_t>::max());
                same = current && *current == payload;
            } else {
                same = m_fileSystem->readSymlink(path) == payload;
            }
            if (same) {
                record(ctx.options, logicalPath, node, BuildOutcome::Skipped, "unchanged");
                return false;
            }
            break;
        }

        case ConflictAction::Rewrite:
            break;
    }

    if (node.kind == NodeKind::Symlink) {
        m_fileSystem->replaceSymlink(payload, path);
    } else {
        create(node, path, payload);
    }
    record(ctx.options, logicalPath, node, BuildOutcome::Overwritten);
    return false;
}

void TreeBuilder::create(const Node& node, const fs::path& path, const std::string& payload) {
    switch (node.kind) {
        case NodeKind::Directory:
            m_fileSystem->createDirectory(path);
            break;
        case NodeKind::File:
            m_fileSystem->writeFile(path, payload);
            break;
        case NodeKind::Symlink:
            m_fileSystem->createSymlink(payload, path);
            break;
    }
}

void TreeBuilder::skipDescendants(const Node& directory, const std::string& logicalPath, const std::string& reason) {
    // Untouched descendants are reported under their declared (unexpanded) names.
    for (const auto& child : directory.children) {
        std::string childPath = JoinPath(logicalPath, child.name);
        m_report.record(childPath, child.kind, BuildOutcome::Skipped, reason);
        skipDescendants(child, childPath, reason);
    }
}

void TreeBuilder::record(const BuildOptions& options, const std::string& path, const Node& node,
                         BuildOutcome outcome, const std::string& detail) {
    if (outcome == BuildOutcome::Failed) {
        std::cerr << "[Builder] Failed " << node.describe() << " at " << path << ": " << detail << std::endl;
    } else if (options.verbose) {
        std::cout << "[Builder] " << OutcomeToString(outcome) << " " << node.describe() << " at " << path;
        if (!detail.empty()) std::cout << " (" << detail << ")";
        std::cout << std::endl;
    }
    m_report.record(path, node.kind, outcome, detail);
}

bool TreeBuilder::cancelRequested(const BuildOptions& options) {
    if (options.cancel && options.cancel->load()) {
        if (!m_stopped) {
            std::cout << "[Builder] Cancellation requested, stopping." << std::endl;
            m_report.markCancelled();
        }
        m_stopped = true;
    }
    return m_stopped;
}

} // namespace dirtree::application
