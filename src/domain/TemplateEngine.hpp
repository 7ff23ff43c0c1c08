#pragma once

#include <map>
#include <string>

namespace dirtree::domain {

/**
 * @brief Stateless placeholder expansion for names, file content and link targets.
 *
 * The only syntax is `{{key}}` (whitespace inside the braces is ignored). There are no
 * defaults, filters or expressions.
 */
class TemplateEngine {
public:
    /**
     * @brief Replaces every placeholder in @p text.
     * @param text Template text.
     * @param variables Available values.
     * @param nodePath Logical path of the node being expanded, used in error messages.
     * @throws TemplateError on an unresolved key, an empty/illegal key or an unterminated marker.
     */
    static std::string Expand(const std::string& text,
                              const std::map<std::string, std::string>& variables,
                              const std::string& nodePath);

    /** @brief True if @p text contains an opening marker. */
    static bool HasPlaceholders(const std::string& text);
};

} // namespace dirtree::domain
