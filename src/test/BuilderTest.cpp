#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "application/TreeBuilder.hpp"
#include "domain/TreeErrors.hpp"
#include "test/TestSupport.hpp"

using namespace dirtree::domain;
using namespace dirtree::application;
using dirtree::test::FaultyFileSystem;
using dirtree::test::ReadAll;
using dirtree::test::ScratchDir;
using dirtree::test::WriteAll;
namespace fs = std::filesystem;

namespace {

Tree SampleTree() {
    return Tree(Node::MakeDirectory("", {
        Node::MakeDirectory("src", {
            Node::MakeFile("main.cpp", "int main() { return 0; }\n"),
            Node::MakeDirectory("detail")
        }),
        Node::MakeFile("README.md", "# Sample\n"),
        Node::MakeFile("empty.txt"),
        Node::MakeSymlink("current", "src")
    }));
}

const BuildEntry& Entry(const BuildReport& report, const std::string& path) {
    for (const auto& entry : report.entries()) {
        if (entry.path == path) return entry;
    }
    std::cerr << "[Test] Missing report entry " << path << std::endl;
    assert(false && "report entry not found");
    return report.entries().front();
}

BuildOptions WithPolicy(ConflictPolicy policy) {
    BuildOptions options;
    options.policy = policy;
    return options;
}

void TestCreatesTree() {
    ScratchDir dir("build_create");
    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());

    // Root is created when missing, including intermediate directories.
    fs::path root = dir.path() / "out" / "nested";
    BuildReport report = builder.build(SampleTree(), root, WithPolicy(ConflictPolicy::Fail));

    assert(report.count(BuildOutcome::Created) == 6);
    assert(!report.hasFailures());
    assert(fs::is_directory(root / "src" / "detail"));
    assert(ReadAll(root / "src" / "main.cpp") == "int main() { return 0; }\n");
    assert(fs::exists(root / "empty.txt") && fs::file_size(root / "empty.txt") == 0);
    assert(fs::is_symlink(root / "current"));
    assert(fs::read_symlink(root / "current") == fs::path("src"));

    // Report follows pre-order declaration order.
    assert(report.entries()[0].path == "src");
    assert(report.entries()[1].path == "src/main.cpp");
    assert(report.entries()[2].path == "src/detail");
    assert(report.entries()[3].path == "README.md");
}

void TestFailPolicyAborts() {
    ScratchDir dir("build_fail");
    WriteAll(dir.path() / "README.md", "keep me");
    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());

    bool thrown = false;
    try {
        builder.build(SampleTree(), dir.path(), WithPolicy(ConflictPolicy::Fail));
    } catch (const ConflictError& e) {
        thrown = true;
        assert(e.path() == "README.md");
    }
    assert(thrown);

    // Entries written before the collision remain; nothing after it was created.
    assert(fs::exists(dir.path() / "src" / "main.cpp"));
    assert(!fs::exists(dir.path() / "empty.txt"));
    assert(ReadAll(dir.path() / "README.md") == "keep me");
    assert(builder.report().count(BuildOutcome::Created) == 3);
    // The entry that stopped the run is part of the partial report.
    assert(Entry(builder.report(), "README.md").outcome == BuildOutcome::Failed);
    assert(builder.report().entries().back().path == "README.md");
}

void TestSkipIsIdempotent() {
    ScratchDir dir("build_skip");
    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    Tree tree = SampleTree();

    builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Skip));
    auto before = fs::last_write_time(dir.path() / "README.md");
    WriteAll(dir.path() / "src" / "main.cpp", "edited");

    BuildReport second = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Skip));
    assert(second.entries().size() == tree.nodeCount());
    for (const auto& entry : second.entries()) {
        assert(entry.outcome == BuildOutcome::Skipped);
    }
    assert(Entry(second, "src/main.cpp").detail == "ancestor skipped");
    assert(ReadAll(dir.path() / "src" / "main.cpp") == "edited");
    assert(fs::last_write_time(dir.path() / "README.md") == before);
}

void TestOverwriteAndKindMismatch() {
    ScratchDir dir("build_overwrite");
    WriteAll(dir.path() / "x", "i am a file");
    WriteAll(dir.path() / "README.md", "old");
    fs::create_directory(dir.path() / "src");
    WriteAll(dir.path() / "src" / "extra.txt", "untouched");

    Tree tree(Node::MakeDirectory("", {
        Node::MakeDirectory("x", {Node::MakeFile("inner.txt", "never written")}),
        Node::MakeDirectory("src", {Node::MakeFile("main.cpp", "new")}),
        Node::MakeFile("README.md", "new readme"),
        Node::MakeFile("after.txt", "sibling after mismatch")
    }));

    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    BuildReport report = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Overwrite));

    const BuildEntry& mismatch = Entry(report, "x");
    assert(mismatch.outcome == BuildOutcome::Failed);
    assert(mismatch.detail.find("ConflictError") != std::string::npos);
    assert(ReadAll(dir.path() / "x") == "i am a file");
    assert(Entry(report, "x/inner.txt").outcome == BuildOutcome::Skipped);

    // Existing directory reused and descended into.
    assert(Entry(report, "src").outcome == BuildOutcome::Skipped);
    assert(Entry(report, "src/main.cpp").outcome == BuildOutcome::Created);
    assert(ReadAll(dir.path() / "src" / "extra.txt") == "untouched");

    assert(Entry(report, "README.md").outcome == BuildOutcome::Overwritten);
    assert(ReadAll(dir.path() / "README.md") == "new readme");
    assert(Entry(report, "after.txt").outcome == BuildOutcome::Created);
    assert(report.hasFailures());
}

void TestMergeOnlyRewritesChanges() {
    ScratchDir dir("build_merge");
    WriteAll(dir.path() / "same.txt", "same");
    WriteAll(dir.path() / "changed.txt", "before");
    fs::create_symlink("old-target", dir.path() / "link");

    Tree tree(Node::MakeDirectory("", {
        Node::MakeFile("same.txt", "same"),
        Node::MakeFile("changed.txt", "after"),
        Node::MakeSymlink("link", "new-target")
    }));

    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    BuildReport report = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Merge));

    assert(Entry(report, "same.txt").outcome == BuildOutcome::Skipped);
    assert(Entry(report, "same.txt").detail == "unchanged");
    assert(Entry(report, "changed.txt").outcome == BuildOutcome::Overwritten);
    assert(ReadAll(dir.path() / "changed.txt") == "after");
    assert(Entry(report, "link").outcome == BuildOutcome::Overwritten);
    assert(fs::read_symlink(dir.path() / "link") == fs::path("new-target"));
}

void TestTemplates() {
    ScratchDir dir("build_template");
    Tree tree(Node::MakeDirectory("", {
        Node::MakeDirectory("{{project}}", {Node::MakeFile("hello.txt", "Hello {{user}}")}),
        Node::MakeFile("raw.txt", "{{kept}}")
    }), {{"project", "demo"}});

    Node verbatim = Node::MakeFile("raw.txt", "{{kept}}");
    verbatim.metadata["verbatim"] = true;
    Tree withVerbatim(Node::MakeDirectory("", {
        Node::MakeDirectory("{{project}}", {Node::MakeFile("hello.txt", "Hello {{user}}")}),
        verbatim
    }), {{"project", "demo"}});

    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    BuildReport report = builder.build(withVerbatim, dir.path(), WithPolicy(ConflictPolicy::Fail), {{"user", "Ada"}});
    assert(ReadAll(dir.path() / "demo" / "hello.txt") == "Hello Ada");
    assert(ReadAll(dir.path() / "raw.txt") == "{{kept}}");
    assert(Entry(report, "demo/hello.txt").outcome == BuildOutcome::Created);

    // Without the variable the build stops and names the key.
    ScratchDir other("build_template_missing");
    bool thrown = false;
    try {
        builder.build(tree, other.path(), WithPolicy(ConflictPolicy::Fail));
    } catch (const TemplateError& e) {
        thrown = true;
        assert(e.key() == "user");
        assert(e.nodePath() == "demo/hello.txt");
    }
    assert(thrown);
    assert(!fs::exists(other.path() / "demo" / "hello.txt"));
}

void TestPathSafety() {
    ScratchDir dir("build_safety");
    fs::create_directory(dir.path() / "root");

    // A traversal name cannot even form a tree.
    bool thrown = false;
    try {
        Tree bad(Node::MakeDirectory("", {Node::MakeDirectory("../../etc")}));
    } catch (const PathSafetyError&) {
        thrown = true;
    }
    assert(thrown);

    // A name that only becomes a traversal after expansion is caught at build time.
    Tree tree(Node::MakeDirectory("", {
        Node::MakeDirectory("{{dir}}", {Node::MakeFile("escaped.txt", "x")})
    }));
    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    for (const std::string value : {"..", "../../etc", "a/../../b"}) {
        thrown = false;
        try {
            builder.build(tree, dir.path() / "root", WithPolicy(ConflictPolicy::Overwrite), {{"dir", value}});
        } catch (const PathSafetyError&) {
            thrown = true;
        }
        assert(thrown);
    }
    assert(!fs::exists(dir.path() / "escaped.txt"));
    assert(fs::is_empty(dir.path() / "root"));

    // Expanded names may not collide with their siblings either.
    Tree colliding(Node::MakeDirectory("", {Node::MakeFile("{{a}}"), Node::MakeFile("same")}));
    thrown = false;
    try {
        builder.build(colliding, dir.path() / "root", WithPolicy(ConflictPolicy::Overwrite), {{"a", "same"}});
    } catch (const StructureError&) {
        thrown = true;
    }
    assert(thrown);
}

void TestIOFailuresContinue() {
    ScratchDir dir("build_io");
    auto fileSystem = std::make_shared<FaultyFileSystem>();
    fileSystem->failWrites = {"locked", "denied.txt"};

    Tree tree(Node::MakeDirectory("", {
        Node::MakeDirectory("locked", {Node::MakeFile("child.txt", "x")}),
        Node::MakeFile("denied.txt", "x"),
        Node::MakeFile("fine.txt", "ok")
    }));

    TreeBuilder builder(fileSystem);
    BuildReport report = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Overwrite));
    assert(Entry(report, "locked").outcome == BuildOutcome::Failed);
    assert(Entry(report, "locked/child.txt").detail == "ancestor failed");
    assert(Entry(report, "denied.txt").outcome == BuildOutcome::Failed);
    assert(Entry(report, "denied.txt").detail.find("IOError") != std::string::npos);
    assert(Entry(report, "fine.txt").outcome == BuildOutcome::Created);
    assert(report.count(BuildOutcome::Failed) == 2);

    // Under Fail the first I/O error aborts the run.
    ScratchDir strict("build_io_fail");
    bool thrown = false;
    try {
        builder.build(tree, strict.path(), WithPolicy(ConflictPolicy::Fail));
    } catch (const IOError& e) {
        thrown = true;
        assert(e.code() == std::errc::permission_denied);
    }
    assert(thrown);
    assert(!fs::exists(strict.path() / "fine.txt"));
    const BuildEntry& aborted = Entry(builder.report(), "locked");
    assert(aborted.outcome == BuildOutcome::Failed);
    assert(aborted.detail.find("permission denied") != std::string::npos ||
           aborted.detail.find("Permission denied") != std::string::npos);
    assert(builder.report().entries().size() == 1);
}

void TestSymlinkReplacement() {
    ScratchDir dir("build_relink");
    fs::create_symlink("old", dir.path() / "current");

    Tree tree(Node::MakeDirectory("", {Node::MakeSymlink("current", "new")}));

    // A failed replacement keeps the previous link.
    auto faulty = std::make_shared<FaultyFileSystem>();
    faulty->failWrites = {"current"};
    TreeBuilder failing(faulty);
    BuildReport failed = failing.build(tree, dir.path(), WithPolicy(ConflictPolicy::Overwrite));
    assert(Entry(failed, "current").outcome == BuildOutcome::Failed);
    assert(fs::read_symlink(dir.path() / "current") == fs::path("old"));

    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    BuildReport report = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Overwrite));
    assert(Entry(report, "current").outcome == BuildOutcome::Overwritten);
    assert(fs::read_symlink(dir.path() / "current") == fs::path("new"));

    // No temporary link is left beside the target.
    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);

    BuildReport merged = builder.build(tree, dir.path(), WithPolicy(ConflictPolicy::Merge));
    assert(Entry(merged, "current").outcome == BuildOutcome::Skipped);
    assert(Entry(merged, "current").detail == "unchanged");
}

void TestCancellation() {
    ScratchDir dir("build_cancel");
    std::atomic<bool> cancel{true};
    BuildOptions options;
    options.cancel = &cancel;

    TreeBuilder builder(std::make_shared<dirtree::infrastructure::LocalFileSystem>());
    BuildReport report = builder.build(SampleTree(), dir.path(), options);
    assert(report.cancelled());
    assert(report.entries().empty());
    assert(fs::is_empty(dir.path()));
}

void TestConflictTable() {
    assert(ConflictResolver::Decide(ConflictPolicy::Fail, NodeKind::File, NodeKind::File) == ConflictAction::Abort);
    assert(ConflictResolver::Decide(ConflictPolicy::Skip, NodeKind::Directory, NodeKind::Directory) == ConflictAction::Skip);
    assert(ConflictResolver::Decide(ConflictPolicy::Skip, NodeKind::File, NodeKind::Directory) == ConflictAction::KindMismatch);
    assert(ConflictResolver::Decide(ConflictPolicy::Overwrite, NodeKind::Directory, NodeKind::Directory) == ConflictAction::Descend);
    assert(ConflictResolver::Decide(ConflictPolicy::Overwrite, NodeKind::File, NodeKind::File) == ConflictAction::Rewrite);
    assert(ConflictResolver::Decide(ConflictPolicy::Merge, NodeKind::File, NodeKind::File) == ConflictAction::RewriteIfChanged);
    assert(ConflictResolver::Decide(ConflictPolicy::Merge, NodeKind::Directory, NodeKind::Directory) == ConflictAction::Descend);
    assert(ConflictResolver::Decide(ConflictPolicy::Merge, NodeKind::Symlink, NodeKind::File) == ConflictAction::KindMismatch);
    assert(PolicyFromString("merge") == ConflictPolicy::Merge);
    assert(!PolicyFromString("replace"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Builder Test..." << std::endl;

    TestConflictTable();
    TestCreatesTree();
    TestFailPolicyAborts();
    TestSkipIsIdempotent();
    TestOverwriteAndKindMismatch();
    TestMergeOnlyRewritesChanges();
    TestTemplates();
    TestPathSafety();
    TestIOFailuresContinue();
    TestSymlinkReplacement();
    TestCancellation();

    std::cout << "[PASS] Builder Test." << std::endl;
    return 0;
}
