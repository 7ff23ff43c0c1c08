/**
 * @file TreeJsonCodec.hpp
 * @brief JSON mapping for tree descriptions and build reports.
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "application/BuildReport.hpp"
#include "domain/Tree.hpp"

namespace dirtree::infrastructure {

/**
 * @class TreeJsonCodec
 * @brief Reads and writes the description format:
 * `{"root": Node, "variables"?: {...}}` with
 * `Node = {"name", "type": "file"|"directory"|"symlink", "content"?, "target"?, "children"?, "metadata"?}`.
 */
class TreeJsonCodec {
public:
    /** @throws StructureError for malformed documents (and whatever Tree validation raises). */
    static domain::Tree FromJson(const nlohmann::json& document,
                                 domain::NameCasePolicy casePolicy = domain::NameCasePolicy::Sensitive);

    /** @brief Parses @p text as JSON first. */
    static domain::Tree Parse(const std::string& text,
                              domain::NameCasePolicy casePolicy = domain::NameCasePolicy::Sensitive);

    /**
     * @brief Loads a description file.
     * @throws IOError if the file cannot be read.
     */
    static domain::Tree LoadFile(const std::filesystem::path& path,
                                 domain::NameCasePolicy casePolicy = domain::NameCasePolicy::Sensitive);

    static nlohmann::json ToJson(const domain::Tree& tree);
    static nlohmann::json NodeToJson(const domain::Node& node);

    static nlohmann::json ReportToJson(const application::BuildReport& report);

    /** @brief Pretty-printed document, as written to disk. */
    static std::string Dump(const nlohmann::json& document);

private:
    static domain::Node NodeFromJson(const nlohmann::json& j, const std::string& path);
};

} // namespace dirtree::infrastructure
