#include "domain/TemplateEngine.hpp"

#include <cctype>

#include "domain/TreeErrors.hpp"

namespace dirtree::domain {

namespace {
    constexpr const char* kOpen = "{{";
    constexpr const char* kClose = "}}";

    void Trim(std::string& s) {
        if (s.empty()) return;
        s.erase(0, s.find_first_not_of(" \t"));
        if (!s.empty()) s.erase(s.find_last_not_of(" \t") + 1);
    }

    bool IsKeyChar(unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    }

    bool IsValidKey(const std::string& key) {
        if (key.empty()) return false;
        for (unsigned char c : key) {
            if (!IsKeyChar(c)) return false;
        }
        return true;
    }
}

std::string TemplateEngine::Expand(const std::string& text,
                                   const std::map<std::string, std::string>& variables,
                                   const std::string& nodePath) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(kOpen, pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);

        size_t close = text.find(kClose, open + 2);
        if (close == std::string::npos) {
            throw TemplateError(text.substr(open), nodePath, "unterminated placeholder");
        }

        std::string key = text.substr(open + 2, close - open - 2);
        Trim(key);
        if (!IsValidKey(key)) {
            throw TemplateError(key, nodePath, "invalid placeholder key");
        }

        auto it = variables.find(key);
        if (it == variables.end()) {
            throw TemplateError(key, nodePath, "unresolved placeholder");
        }
        out += it->second;
        pos = close + 2;
    }
    return out;
}

bool TemplateEngine::HasPlaceholders(const std::string& text) {
    return text.find(kOpen) != std::string::npos;
}

} // namespace dirtree::domain
