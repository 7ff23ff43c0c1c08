#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "application/TreeBuilder.hpp"
#include "application/TreeScanner.hpp"
#include "domain/TreeErrors.hpp"
#include "infrastructure/TreeJsonCodec.hpp"
#include "test/TestSupport.hpp"

using namespace dirtree::domain;
using namespace dirtree::application;
using dirtree::infrastructure::LocalFileSystem;
using dirtree::infrastructure::TreeJsonCodec;
using dirtree::test::ReadAll;
using dirtree::test::ScratchDir;
namespace fs = std::filesystem;

namespace {

const char* kDescription = R"({
    "variables": {"project": "engine", "year": 2024},
    "root": {
        "name": "workspace",
        "type": "directory",
        "children": [
            {"name": "{{project}}", "type": "directory", "children": [
                {"name": "main.cpp", "type": "file", "content": "// {{project}} ({{year}})\n"},
                {"name": "empty.txt", "type": "file"},
                {"name": "raw.txt", "type": "file", "content": "{{not_a_var}}", "metadata": {"verbatim": true}}
            ]},
            {"name": "docs", "type": "directory", "children": []},
            {"name": "current", "type": "symlink", "target": "engine"}
        ]
    }
})";

bool ParseFails(const std::string& text) {
    try {
        TreeJsonCodec::Parse(text);
    } catch (const StructureError&) {
        return true;
    }
    return false;
}

void TestCodec() {
    Tree tree = TreeJsonCodec::Parse(kDescription);
    assert(tree.root().name == "workspace");
    assert(tree.variables().at("project") == "engine");
    assert(tree.variables().at("year") == "2024");
    assert(tree.nodeCount() == 6);

    const Node& project = tree.root().children[0];
    assert(project.kind == NodeKind::Directory && project.children.size() == 3);
    assert(!project.children[1].content);
    assert(project.children[2].flag("verbatim"));

    // Re-encoding loses nothing the model carries.
    Tree again = TreeJsonCodec::FromJson(TreeJsonCodec::ToJson(tree));
    assert(SameStructure(tree, again));
    assert(again.variables() == tree.variables());
    assert(again.root().children[0].children[2].flag("verbatim"));

    auto encoded = TreeJsonCodec::NodeToJson(Node::MakeSymlink("l", "t"));
    assert(encoded["type"] == "symlink" && encoded["target"] == "t");
    assert(!encoded.contains("children"));

    assert(ParseFails("not json"));
    assert(ParseFails("[]"));
    assert(ParseFails(R"({"variables": {}})"));
    assert(ParseFails(R"({"root": {"name": "r"}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "socket"}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "directory", "children": {}}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "directory", "children": [
        {"name": "f", "type": "file", "children": []}]}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "directory", "children": [
        {"name": "f", "type": "file", "content": 42}]}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "directory", "metadata": {"tags": [1]}}})"));
    assert(ParseFails(R"({"root": {"name": "r", "type": "directory"}, "variables": {"v": {"x": 1}}})"));

    bool thrown = false;
    try {
        TreeJsonCodec::Parse(R"({"root": {"name": "r", "type": "directory", "children": [
            {"name": "..", "type": "directory"}]}})");
    } catch (const PathSafetyError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        TreeJsonCodec::LoadFile("/nonexistent/dirtree/description.json");
    } catch (const IOError&) {
        thrown = true;
    }
    assert(thrown);
}

void TestBuildThenScan() {
    ScratchDir dir("roundtrip");
    auto fileSystem = std::make_shared<LocalFileSystem>();

    Tree description = TreeJsonCodec::Parse(kDescription);
    TreeBuilder builder(fileSystem);
    BuildReport report = builder.build(description, dir.path() / "out", BuildOptions{});
    assert(!report.hasFailures());
    assert(report.count(BuildOutcome::Created) == 6);
    assert(ReadAll(dir.path() / "out" / "engine" / "main.cpp") == "// engine (2024)\n");
    assert(ReadAll(dir.path() / "out" / "engine" / "raw.txt") == "{{not_a_var}}");

    TreeScanner scanner(fileSystem);
    Tree scanned = scanner.scan(dir.path() / "out", std::vector<std::string>{});

    Tree expected(Node::MakeDirectory("workspace", {
        Node::MakeDirectory("engine", {
            Node::MakeFile("main.cpp", "// engine (2024)\n"),
            Node::MakeFile("empty.txt"),
            Node::MakeFile("raw.txt", "{{not_a_var}}")
        }),
        Node::MakeDirectory("docs"),
        Node::MakeSymlink("current", "engine")
    }));
    assert(SameStructure(expected, scanned));

    // The scanned description rebuilds the same hierarchy, literal braces included.
    Tree reloaded = TreeJsonCodec::Parse(TreeJsonCodec::Dump(TreeJsonCodec::ToJson(scanned)));
    BuildReport second = builder.build(reloaded, dir.path() / "copy", BuildOptions{});
    assert(!second.hasFailures());
    assert(ReadAll(dir.path() / "copy" / "engine" / "raw.txt") == "{{not_a_var}}");

    Tree rescanned = scanner.scan(dir.path() / "copy", std::vector<std::string>{});
    assert(SameStructure(scanned, rescanned));
}

void TestReportJson() {
    BuildReport report;
    report.record("a", NodeKind::Directory, BuildOutcome::Created);
    report.record("a/b.txt", NodeKind::File, BuildOutcome::Failed, "permission denied");
    report.markCancelled();

    auto j = TreeJsonCodec::ReportToJson(report);
    assert(j["entries"].size() == 2);
    assert(j["entries"][0]["outcome"] == "created");
    assert(!j["entries"][0].contains("detail"));
    assert(j["entries"][1]["type"] == "file");
    assert(j["entries"][1]["detail"] == "permission denied");
    assert(j["counts"]["created"] == 1);
    assert(j["counts"]["failed"] == 1);
    assert(j["counts"]["skipped"] == 0);
    assert(j["cancelled"] == true);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Round-Trip Test..." << std::endl;

    TestCodec();
    TestBuildThenScan();
    TestReportJson();

    std::cout << "[PASS] Round-Trip Test." << std::endl;
    return 0;
}
