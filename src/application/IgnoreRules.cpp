#include "application/IgnoreRules.hpp"

#include <fnmatch.h>

namespace dirtree::application {

IgnoreRules::IgnoreRules(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        add(pattern);
    }
}

void IgnoreRules::add(const std::string& pattern) {
    Rule rule;
    rule.pattern = pattern;
    if (!rule.pattern.empty() && rule.pattern.back() == '/') {
        rule.directoryOnly = true;
        rule.pattern.pop_back();
    }
    if (!rule.pattern.empty() && rule.pattern.front() == '/') {
        rule.pattern.erase(0, 1);
        rule.anchored = true;
    }
    if (rule.pattern.find('/') != std::string::npos) {
        rule.anchored = true;
    }
    if (rule.pattern.empty()) return;
    m_rules.push_back(rule);
}

bool IgnoreRules::matches(const std::string& relativePath, bool isDirectory) const {
    size_t slash = relativePath.rfind('/');
    std::string basename = slash == std::string::npos ? relativePath : relativePath.substr(slash + 1);

    for (const auto& rule : m_rules) {
        if (rule.directoryOnly && !isDirectory) continue;
        if (rule.anchored) {
            if (fnmatch(rule.pattern.c_str(), relativePath.c_str(), FNM_PATHNAME) == 0) return true;
        } else {
            if (fnmatch(rule.pattern.c_str(), basename.c_str(), 0) == 0) return true;
        }
    }
    return false;
}

} // namespace dirtree::application
