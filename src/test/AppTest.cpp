#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "app/DirTreeApp.hpp"
#include "test/TestSupport.hpp"

using dirtree::app::DirTreeApp;
using dirtree::test::ReadAll;
using dirtree::test::ScratchDir;
using dirtree::test::WriteAll;

namespace {

int RunApp(std::vector<std::string> args) {
    args.insert(args.begin(), "dirtree");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    DirTreeApp app;
    return app.Run(static_cast<int>(args.size()), argv.data());
}

} // namespace

int main() {
    std::cout << "[Test] Starting App Test..." << std::endl;

    ScratchDir dir("app");
    std::filesystem::create_directories(dir.path() / "tree");
    WriteAll(dir.path() / "tree" / "notes.txt", "hello");
    WriteAll(dir.path() / "tree" / "odd.txt", std::string("a\xED\xA0\x80", 4));
    WriteAll(dir.path() / "tree" / std::string("bad\xff"), "x");
    const std::string settings = (dir.path() / "settings.json").string();
    WriteAll(settings, "{}");
    const std::string root = (dir.path() / "tree").string();
    const std::string output = (dir.path() / "scan.json").string();

    // Sizes must be plain non-negative numbers.
    assert(RunApp({"scan", root, "--config", settings, "--max-bytes", "-1"}) == 2);
    assert(RunApp({"scan", root, "--config", settings, "--max-bytes", " 5"}) == 2);
    assert(RunApp({"scan", root, "--config", settings, "--max-bytes", "12kb"}) == 2);

    // Odd content and names do not stop the scan from producing a document.
    assert(RunApp({"scan", root, "--config", settings, "--max-bytes", "64", "--output", output}) == 0);
    const std::string document = ReadAll(output);
    assert(document.find("notes.txt") != std::string::npos);
    assert(document.find("\"binary\": true") != std::string::npos);
    assert(document.find("bad") == std::string::npos);

    // The document builds back into a fresh directory.
    const std::string copy = (dir.path() / "copy").string();
    assert(RunApp({"build", output, copy, "--config", settings}) == 0);
    assert(ReadAll(dir.path() / "copy" / "notes.txt") == "hello");
    assert(ReadAll(dir.path() / "copy" / "odd.txt").empty());

    assert(RunApp({"frobnicate"}) == 2);

    std::cout << "[PASS] App Test." << std::endl;
    return 0;
}
