#include <cassert>
#include <iostream>

#include "domain/TreeErrors.hpp"
#include "infrastructure/PathResolver.hpp"

using dirtree::domain::PathSafetyError;
using dirtree::infrastructure::PathResolver;
namespace fs = std::filesystem;

namespace {

bool Rejects(const PathResolver& resolver, const std::vector<std::string>& segments) {
    try {
        resolver.Resolve(segments);
    } catch (const PathSafetyError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Path Resolver Test..." << std::endl;

    PathResolver resolver("/srv/target/");
    assert(resolver.root() == fs::path("/srv/target"));
    assert(resolver.Resolve({"a", "b.txt"}) == fs::path("/srv/target/a/b.txt"));
    assert(PathResolver::JoinLogical({"a", "b.txt"}) == "a/b.txt");

    assert(Rejects(resolver, {}));
    assert(Rejects(resolver, {".."}));
    assert(Rejects(resolver, {"a", ".."}));
    assert(Rejects(resolver, {"../../etc"}));
    assert(Rejects(resolver, {"/etc"}));
    assert(Rejects(resolver, {"a/b"}));
    assert(Rejects(resolver, {"."}));
    assert(Rejects(resolver, {""}));

    assert(resolver.Resolve({"x.txt"}) == fs::path("/srv/target/x.txt"));

    bool thrown = false;
    try {
        PathResolver relative("relative/root");
    } catch (const PathSafetyError&) {
        thrown = true;
    }
    assert(thrown);

    PathResolver::RequireInside("/srv/target/a", "/srv/target", "link");
    PathResolver::RequireInside("/srv/target", "/srv/target", "link");
    thrown = false;
    try {
        PathResolver::RequireInside("/etc", "/srv/target", "link");
    } catch (const PathSafetyError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[PASS] Path Resolver Test." << std::endl;
    return 0;
}
