/**
 * @file TreeScanner.cpp
 * @brief Implementation of TreeScanner.
 */

#include "application/TreeScanner.hpp"

#include <algorithm>
#include <iostream>

#include "domain/TemplateEngine.hpp"
#include "domain/TreeErrors.hpp"

namespace dirtree::application {

namespace fs = std::filesystem;
using domain::IOError;
using domain::Node;
using domain::NodeKind;
using infrastructure::PathResolver;

namespace {

// Strict UTF-8 (RFC 3629): no overlongs, surrogates or code points above U+10FFFF.
// Content and names end up in JSON strings, which must be valid UTF-8.
bool IsText(const std::string& data) {
    size_t i = 0;
    while (i < data.size()) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == 0) return false;
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) low = 0xA0;
            if (c == 0xED) high = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) low = 0x90;
            if (c == 0xF4) high = 0x8F;
        } else {
            return false;
        }

        if (i + extra >= data.size()) return false;
        unsigned char second = static_cast<unsigned char>(data[i + 1]);
        if (second < low || second > high) return false;
        for (size_t k = 2; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

void MarkSkipped(Node& node, const std::string& relativePath, const std::string& reason) {
    node.metadata["skipped"] = true;
    node.metadata["error"] = IsText(reason) ? reason : std::string("entry could not be read");
    std::cerr << "[Scanner] Skipping " << node.describe() << " at " << relativePath << ": " << reason << std::endl;
}

} // namespace

TreeScanner::TreeScanner(std::shared_ptr<domain::FileSystemGateway> fileSystem)
    : m_fileSystem(std::move(fileSystem)) {}

domain::Tree TreeScanner::scan(const fs::path& rootPath,
                               const std::vector<std::string>& ignorePatterns,
                               const ScanOptions& options) {
    return scan(rootPath, IgnoreRules(ignorePatterns), options);
}

domain::Tree TreeScanner::scan(const fs::path& rootPath,
                               const IgnoreRules& ignoreRules,
                               const ScanOptions& options) {
    PathResolver resolver(rootPath);

    auto status = m_fileSystem->status(resolver.root());
    if (!status) {
        throw IOError(resolver.root().string(), std::make_error_code(std::errc::no_such_file_or_directory), "scan");
    }
    fs::path realRoot = m_fileSystem->canonical(resolver.root());
    auto realStatus = m_fileSystem->status(realRoot);
    if (!realStatus || realStatus->kind != NodeKind::Directory) {
        throw IOError(resolver.root().string(), std::make_error_code(std::errc::not_a_directory), "scan");
    }

    Context ctx{ignoreRules, options, resolver, realRoot, {}, false};
    ctx.visited.insert(realRoot);

    std::string rootName = resolver.root().filename().string();
    if (!IsText(rootName)) {
        std::cerr << "[Scanner] Root name is not valid UTF-8, leaving it empty." << std::endl;
        rootName.clear();
    }
    Node root = Node::MakeDirectory(rootName);
    std::vector<std::string> segments;
    scanDirectory(ctx, root, resolver.root(), segments);

    if (ctx.cancelled) {
        root.metadata["cancelled"] = true;
        std::cout << "[Scanner] Scan cancelled, tree is partial." << std::endl;
    }
    return domain::Tree(std::move(root));
}

void TreeScanner::scanDirectory(Context& ctx, Node& directory, const fs::path& directoryPath,
                                std::vector<std::string>& segments) {
    std::vector<std::string> names;
    try {
        names = m_fileSystem->listDirectory(directoryPath);
    } catch (const IOError& e) {
        MarkSkipped(directory, PathResolver::JoinLogical(segments), e.what());
        return;
    }
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        if (ctx.cancelled || (ctx.options.cancel && ctx.options.cancel->load())) {
            ctx.cancelled = true;
            return;
        }

        if (!IsText(name)) {
            std::cerr << "[Scanner] Leaving out entry with a non UTF-8 name in '"
                      << PathResolver::JoinLogical(segments) << "'" << std::endl;
            continue;
        }

        segments.push_back(name);
        const std::string relativePath = PathResolver::JoinLogical(segments);
        try {
            domain::Tree::ValidateName(name, relativePath);
        } catch (const domain::TreeError& e) {
            std::cerr << "[Scanner] Leaving out unrepresentable entry " << relativePath << ": " << e.what() << std::endl;
            segments.pop_back();
            continue;
        }

        Node child;
        child.name = name;
        if (scanEntry(ctx, child, ctx.resolver.Resolve(segments), segments)) {
            if (ctx.options.verbose) {
                std::cout << "[Scanner] Recorded " << child.describe() << " at " << relativePath << std::endl;
            }
            directory.children.push_back(std::move(child));
        }
        segments.pop_back();
    }
}

bool TreeScanner::scanEntry(Context& ctx, Node& node, const fs::path& path, std::vector<std::string>& segments) {
    const std::string relativePath = PathResolver::JoinLogical(segments);

    std::optional<domain::EntryStatus> status;
    try {
        status = m_fileSystem->status(path);
    } catch (const IOError& e) {
        node.kind = NodeKind::File;
        MarkSkipped(node, relativePath, e.what());
        return true;
    }
    if (!status) {
        node.kind = NodeKind::File;
        MarkSkipped(node, relativePath, "entry vanished during scan");
        return true;
    }

    if (ctx.rules.matches(relativePath, status->kind == NodeKind::Directory)) {
        if (ctx.options.verbose) {
            std::cout << "[Scanner] Ignored " << relativePath << std::endl;
        }
        return false;
    }

    switch (status->kind) {
        case NodeKind::Directory:
            node.kind = NodeKind::Directory;
            if (ctx.options.followSymlinks) {
                try {
                    ctx.visited.insert(m_fileSystem->canonical(path));
                } catch (const IOError& e) {
                    MarkSkipped(node, relativePath, e.what());
                    return true;
                }
            }
            scanDirectory(ctx, node, path, segments);
            break;
        case NodeKind::File:
            node.kind = NodeKind::File;
            if (!status->regular) {
                node.metadata["special"] = true;
            } else {
                captureFile(ctx, node, path, relativePath);
            }
            break;
        case NodeKind::Symlink:
            scanSymlink(ctx, node, path, segments);
            break;
    }
    return true;
}

void TreeScanner::scanSymlink(Context& ctx, Node& node, const fs::path& path, std::vector<std::string>& segments) {
    const std::string relativePath = PathResolver::JoinLogical(segments);
    node.kind = NodeKind::Symlink;

    try {
        node.target = m_fileSystem->readSymlink(path);
    } catch (const IOError& e) {
        node.target = std::string();
        MarkSkipped(node, relativePath, e.what());
        return;
    }
    if (!IsText(*node.target)) {
        node.target = std::string();
        MarkSkipped(node, relativePath, "link target is not valid UTF-8");
        return;
    }
    if (!ctx.options.followSymlinks) return;

    fs::path real;
    try {
        real = m_fileSystem->canonical(path);
    } catch (const IOError&) {
        node.metadata["dangling"] = true;
        return;
    }
    PathResolver::RequireInside(real, ctx.realRoot, relativePath);

    std::optional<domain::EntryStatus> status;
    try {
        status = m_fileSystem->status(real);
    } catch (const IOError& e) {
        MarkSkipped(node, relativePath, e.what());
        return;
    }
    if (!status) {
        node.metadata["dangling"] = true;
        return;
    }

    if (status->kind == NodeKind::Directory) {
        if (ctx.visited.count(real) > 0) {
            // Already entered (an ancestor or an earlier link): keep the link, do not re-descend.
            node.metadata["cycle"] = true;
            if (ctx.options.verbose) {
                std::cout << "[Scanner] Cycle at " << relativePath << ": " << node.describe() << std::endl;
            }
            return;
        }
        ctx.visited.insert(real);
        node.metadata["symlink_target"] = *node.target;
        node.kind = NodeKind::Directory;
        node.target.reset();
        scanDirectory(ctx, node, path, segments);
    } else if (status->regular) {
        node.metadata["symlink_target"] = *node.target;
        node.kind = NodeKind::File;
        node.target.reset();
        captureFile(ctx, node, path, relativePath);
    }
}

void TreeScanner::captureFile(Context& ctx, Node& node, const fs::path& path, const std::string& relativePath) {
    if (!ctx.options.captureContent) return;

    std::optional<std::string> content;
    try {
        content = m_fileSystem->readFile(path, ctx.options.maxContentBytes);
    } catch (const IOError& e) {
        MarkSkipped(node, relativePath, e.what());
        return;
    }

    if (!content) {
        node.metadata["truncated"] = true;
        return;
    }
    if (!IsText(*content)) {
        node.metadata["binary"] = true;
        return;
    }
    if (domain::TemplateEngine::HasPlaceholders(*content)) {
        node.metadata["verbatim"] = true;
    }
    node.content = std::move(content);
}

} // namespace dirtree::application
