#include <cassert>
#include <iostream>

#include "domain/TemplateEngine.hpp"
#include "domain/TreeErrors.hpp"

using namespace dirtree::domain;

int main() {
    std::cout << "[Test] Starting Template Engine Test..." << std::endl;

    const std::map<std::string, std::string> vars = {{"user", "Ada"}, {"project.name", "engine"}};

    assert(TemplateEngine::Expand("Hello {{user}}", vars, "greeting.txt") == "Hello Ada");
    assert(TemplateEngine::Expand("{{ user }}-{{project.name}}", vars, "n") == "Ada-engine");
    assert(TemplateEngine::Expand("no markers", {}, "n") == "no markers");
    assert(TemplateEngine::Expand("single { brace }", {}, "n") == "single { brace }");
    assert(TemplateEngine::HasPlaceholders("a {{b}}"));
    assert(!TemplateEngine::HasPlaceholders("a {b}"));

    // Missing key names the key and the node.
    bool thrown = false;
    try {
        TemplateEngine::Expand("Hello {{user}}", {}, "docs/greeting.txt");
    } catch (const TemplateError& e) {
        thrown = true;
        assert(e.key() == "user");
        assert(e.nodePath() == "docs/greeting.txt");
        assert(std::string(e.what()).find("user") != std::string::npos);
    }
    assert(thrown);

    // Unterminated and illegal keys.
    thrown = false;
    try {
        TemplateEngine::Expand("Hello {{user", vars, "n");
    } catch (const TemplateError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        TemplateEngine::Expand("{{ }}", vars, "n");
    } catch (const TemplateError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        TemplateEngine::Expand("{{system(rm)}}", vars, "n");
    } catch (const TemplateError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[PASS] Template Engine Test." << std::endl;
    return 0;
}
