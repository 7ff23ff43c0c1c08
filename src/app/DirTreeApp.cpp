/**
 * @file DirTreeApp.cpp
 * @brief Implementation of the DirTreeApp class.
 */
#include "app/DirTreeApp.hpp"

#include <atomic>
#include <cctype>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

#include "application/TreeBuilder.hpp"
#include "application/TreeScanner.hpp"
#include "domain/TreeErrors.hpp"
#include "infrastructure/LocalFileSystem.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TreeJsonCodec.hpp"

namespace dirtree::app {

namespace {

std::atomic<bool> g_cancelRequested{false};

void HandleInterrupt(int) {
    g_cancelRequested.store(true);
}

/** @brief Bad command line; reported with the usage text. */
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

const std::string& NextValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError("missing value for " + args[i]);
    }
    return args[++i];
}

std::uintmax_t ParseSize(const std::string& text) {
    // stoull accepts a sign and leading blanks, and wraps negative input.
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw UsageError("invalid size '" + text + "'");
    }
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError("invalid size '" + text + "'");
    }
    if (consumed != text.size()) throw UsageError("invalid size '" + text + "'");
    return static_cast<std::uintmax_t>(value);
}

void WriteText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open '" + path + "' for writing");
    }
    out << text << "\n";
    if (out.fail()) {
        throw std::runtime_error("write to '" + path + "' failed");
    }
}

} // namespace

int DirTreeApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        PrintUsage();
        return args.empty() ? 2 : 0;
    }

    std::signal(SIGINT, HandleInterrupt);

    const std::string command = args[0];
    args.erase(args.begin());
    try {
        if (command == "build") return RunBuild(args);
        if (command == "scan") return RunScan(args);
        throw UsageError("unknown command '" + command + "'");
    } catch (const UsageError& e) {
        std::cerr << "[dirtree] " << e.what() << std::endl;
        PrintUsage();
        return 2;
    } catch (const domain::TreeError& e) {
        std::cerr << "[dirtree] " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[dirtree] Error: " << e.what() << std::endl;
        return 2;
    }
}

int DirTreeApp::RunBuild(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string configPath;
    std::string reportPath;
    std::optional<domain::ConflictPolicy> policy;
    std::optional<bool> caseSensitive;
    domain::VariableMap variables;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--policy") {
            const std::string& name = NextValue(args, i);
            policy = domain::PolicyFromString(name);
            if (!policy) throw UsageError("unknown policy '" + name + "'");
        } else if (arg == "--var") {
            const std::string& pair = NextValue(args, i);
            size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) throw UsageError("--var expects key=value, got '" + pair + "'");
            variables[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else if (arg == "--case-insensitive") {
            caseSensitive = false;
        } else if (arg == "--config") {
            configPath = NextValue(args, i);
        } else if (arg == "--report-json") {
            reportPath = NextValue(args, i);
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        throw UsageError("build expects <description.json> <target-dir>");
    }

    infrastructure::Settings settings = LoadSettings(configPath);
    const bool sensitive = caseSensitive.value_or(settings.caseSensitive);

    domain::Tree tree = infrastructure::TreeJsonCodec::LoadFile(
        positional[0], sensitive ? domain::NameCasePolicy::Sensitive : domain::NameCasePolicy::Insensitive);

    application::BuildOptions options;
    options.policy = policy.value_or(settings.conflictPolicy);
    options.cancel = &g_cancelRequested;
    options.verbose = verbose;

    auto fileSystem = std::make_shared<infrastructure::LocalFileSystem>();
    application::TreeBuilder builder(fileSystem);
    const auto target = infrastructure::PathUtils::MakeAbsolute(positional[1]);

    std::cout << "[dirtree] Building " << tree.nodeCount() << " entries into " << target
              << " (policy: " << domain::PolicyToString(options.policy) << ")" << std::endl;

    application::BuildReport report;
    try {
        report = builder.build(tree, target, options, variables);
    } catch (const domain::TreeError&) {
        // Whatever was written before the abort stays on disk; show it.
        std::cerr << builder.report().renderText(verbose);
        if (!reportPath.empty()) {
            WriteText(reportPath, infrastructure::TreeJsonCodec::Dump(
                infrastructure::TreeJsonCodec::ReportToJson(builder.report())));
        }
        throw;
    }

    std::cout << report.renderText(verbose);
    if (!reportPath.empty()) {
        WriteText(reportPath, infrastructure::TreeJsonCodec::Dump(infrastructure::TreeJsonCodec::ReportToJson(report)));
    }
    if (report.cancelled()) return 2;
    return report.hasFailures() ? 1 : 0;
}

int DirTreeApp::RunScan(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string configPath;
    std::string outputPath;
    std::vector<std::string> extraIgnores;
    std::optional<bool> followSymlinks;
    std::optional<std::uintmax_t> maxBytes;
    bool captureContent = true;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--output" || arg == "-o") {
            outputPath = NextValue(args, i);
        } else if (arg == "--ignore") {
            extraIgnores.push_back(NextValue(args, i));
        } else if (arg == "--follow-symlinks") {
            followSymlinks = true;
        } else if (arg == "--max-bytes") {
            maxBytes = ParseSize(NextValue(args, i));
        } else if (arg == "--no-content") {
            captureContent = false;
        } else if (arg == "--config") {
            configPath = NextValue(args, i);
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 1) {
        throw UsageError("scan expects <root-dir>");
    }

    infrastructure::Settings settings = LoadSettings(configPath);

    application::IgnoreRules rules(settings.ignorePatterns);
    for (const auto& pattern : extraIgnores) {
        rules.add(pattern);
    }

    application::ScanOptions options;
    options.followSymlinks = followSymlinks.value_or(settings.followSymlinks);
    options.maxContentBytes = maxBytes.value_or(settings.maxContentBytes);
    options.captureContent = captureContent;
    options.cancel = &g_cancelRequested;
    options.verbose = verbose;

    auto fileSystem = std::make_shared<infrastructure::LocalFileSystem>();
    application::TreeScanner scanner(fileSystem);
    domain::Tree tree = scanner.scan(infrastructure::PathUtils::MakeAbsolute(positional[0]), rules, options);

    const std::string document = infrastructure::TreeJsonCodec::Dump(infrastructure::TreeJsonCodec::ToJson(tree));
    if (outputPath.empty()) {
        std::cout << document << std::endl;
    } else {
        WriteText(outputPath, document);
        std::cout << "[dirtree] Wrote " << tree.nodeCount() << " entries to " << outputPath << std::endl;
    }
    return g_cancelRequested.load() ? 2 : 0;
}

infrastructure::Settings DirTreeApp::LoadSettings(const std::string& explicitPath) const {
    if (!explicitPath.empty()) {
        if (!std::filesystem::exists(explicitPath)) {
            throw UsageError("config file '" + explicitPath + "' does not exist");
        }
        return infrastructure::ConfigLoader::Load(explicitPath);
    }
    return infrastructure::ConfigLoader::Load(infrastructure::PathUtils::GetDefaultSettingsPath());
}

void DirTreeApp::PrintUsage() const {
    std::cerr <<
        "Usage:\n"
        "  dirtree build <description.json> <target-dir> [--policy fail|skip|overwrite|merge]\n"
        "                [--var key=value]... [--case-insensitive] [--config FILE]\n"
        "                [--report-json FILE] [--verbose]\n"
        "  dirtree scan <root-dir> [--output FILE] [--ignore PATTERN]... [--follow-symlinks]\n"
        "               [--max-bytes N] [--no-content] [--config FILE] [--verbose]\n";
}

} // namespace dirtree::app
