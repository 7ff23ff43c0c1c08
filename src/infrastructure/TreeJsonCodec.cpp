/**
 * @file TreeJsonCodec.cpp
 * @brief Implementation of TreeJsonCodec.
 */

#include "infrastructure/TreeJsonCodec.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include "domain/TreeErrors.hpp"

namespace dirtree::infrastructure {

using json = nlohmann::json;
using domain::Node;
using domain::NodeKind;
using domain::StructureError;

namespace {

std::string ChildPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

domain::MetadataValue ScalarFromJson(const json& value, const std::string& key, const std::string& path) {
    switch (value.type()) {
        case json::value_t::boolean: return value.get<bool>();
        case json::value_t::number_integer: return value.get<std::int64_t>();
        case json::value_t::number_unsigned: return static_cast<std::int64_t>(value.get<std::uint64_t>());
        case json::value_t::number_float: return value.get<double>();
        case json::value_t::string: return value.get<std::string>();
        default:
            throw StructureError("metadata '" + key + "' of '" + path + "' must be a scalar");
    }
}

json ScalarToJson(const domain::MetadataValue& value) {
    return std::visit([](auto&& v) -> json { return json(v); }, value);
}

std::optional<std::string> OptionalString(const json& j, const char* field, const std::string& path) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw StructureError(std::string("'") + field + "' of '" + path + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

Node TreeJsonCodec::NodeFromJson(const json& j, const std::string& parentPath) {
    if (!j.is_object()) {
        throw StructureError("node under '" + parentPath + "' must be an object");
    }

    Node node;
    node.name = OptionalString(j, "name", parentPath).value_or("");
    const std::string path = ChildPath(parentPath, node.name);

    auto type = OptionalString(j, "type", path);
    if (!type) {
        throw StructureError("node '" + path + "' has no type");
    }
    auto kind = domain::KindFromString(*type);
    if (!kind) {
        throw StructureError("node '" + path + "' has unknown type '" + *type + "'");
    }
    node.kind = *kind;
    node.content = OptionalString(j, "content", path);
    node.target = OptionalString(j, "target", path);

    if (auto it = j.find("children"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw StructureError("'children' of '" + path + "' must be an array");
        }
        if (node.kind != NodeKind::Directory) {
            throw StructureError(domain::KindToString(node.kind) + " '" + path + "' cannot have children");
        }
        for (const auto& child : *it) {
            node.children.push_back(NodeFromJson(child, path));
        }
    }

    if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw StructureError("'metadata' of '" + path + "' must be an object");
        }
        for (const auto& [key, value] : it->items()) {
            node.metadata[key] = ScalarFromJson(value, key, path);
        }
    }
    return node;
}

domain::Tree TreeJsonCodec::FromJson(const json& document, domain::NameCasePolicy casePolicy) {
    if (!document.is_object()) {
        throw StructureError("description must be a JSON object");
    }
    auto rootIt = document.find("root");
    if (rootIt == document.end()) {
        throw StructureError("description has no 'root'");
    }
    Node root = NodeFromJson(*rootIt, "");

    domain::VariableMap variables;
    if (auto it = document.find("variables"); it != document.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw StructureError("'variables' must be an object");
        }
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                variables[key] = value.get<std::string>();
            } else if (value.is_primitive() && !value.is_null()) {
                variables[key] = value.dump();
            } else {
                throw StructureError("variable '" + key + "' must be a scalar");
            }
        }
    }
    return domain::Tree(std::move(root), std::move(variables), casePolicy);
}

domain::Tree TreeJsonCodec::Parse(const std::string& text, domain::NameCasePolicy casePolicy) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw StructureError(std::string("invalid JSON: ") + e.what());
    }
    return FromJson(document, casePolicy);
}

domain::Tree TreeJsonCodec::LoadFile(const std::filesystem::path& path, domain::NameCasePolicy casePolicy) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw domain::IOError(path.string(), std::error_code(errno != 0 ? errno : ENOENT, std::generic_category()),
                              "open description");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return Parse(buffer.str(), casePolicy);
}

json TreeJsonCodec::NodeToJson(const Node& node) {
    json j;
    j["name"] = node.name;
    j["type"] = domain::KindToString(node.kind);
    switch (node.kind) {
        case NodeKind::File:
            if (node.content) j["content"] = *node.content;
            break;
        case NodeKind::Symlink:
            j["target"] = node.target.value_or("");
            break;
        case NodeKind::Directory: {
            json children = json::array();
            for (const auto& child : node.children) {
                children.push_back(NodeToJson(child));
            }
            j["children"] = children;
            break;
        }
    }
    if (!node.metadata.empty()) {
        json metadata = json::object();
        for (const auto& [key, value] : node.metadata) {
            metadata[key] = ScalarToJson(value);
        }
        j["metadata"] = metadata;
    }
    return j;
}

json TreeJsonCodec::ToJson(const domain::Tree& tree) {
    json document;
    document["root"] = NodeToJson(tree.root());
    if (!tree.variables().empty()) {
        document["variables"] = tree.variables();
    }
    return document;
}

json TreeJsonCodec::ReportToJson(const application::BuildReport& report) {
    using application::BuildOutcome;

    json entries = json::array();
    for (const auto& entry : report.entries()) {
        json e = {
            {"path", entry.path},
            {"type", domain::KindToString(entry.kind)},
            {"outcome", application::OutcomeToString(entry.outcome)}
        };
        if (!entry.detail.empty()) e["detail"] = entry.detail;
        entries.push_back(e);
    }

    return {
        {"entries", entries},
        {"counts", {
            {"created", report.count(BuildOutcome::Created)},
            {"overwritten", report.count(BuildOutcome::Overwritten)},
            {"skipped", report.count(BuildOutcome::Skipped)},
            {"failed", report.count(BuildOutcome::Failed)}
        }},
        {"cancelled", report.cancelled()}
    };
}

std::string TreeJsonCodec::Dump(const json& document) {
    return document.dump(4);
}

} // namespace dirtree::infrastructure
