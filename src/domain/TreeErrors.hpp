/**
 * @file TreeErrors.hpp
 * @brief Exception types raised by the tree model, builder and scanner.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace dirtree::domain {

/**
 * @class TreeError
 * @brief Base of every error raised while converting trees.
 */
class TreeError : public std::runtime_error {
public:
    explicit TreeError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Malformed or invalid tree (bad names, duplicate siblings, wrong fields for a kind). */
class StructureError : public TreeError {
public:
    explicit StructureError(const std::string& message)
        : TreeError("StructureError: " + message) {}
};

/** @brief A resolved path would leave the designated root. */
class PathSafetyError : public TreeError {
public:
    explicit PathSafetyError(const std::string& message)
        : TreeError("PathSafetyError: " + message) {}
};

/**
 * @class TemplateError
 * @brief A placeholder could not be expanded.
 */
class TemplateError : public TreeError {
public:
    TemplateError(std::string key, std::string nodePath, const std::string& message)
        : TreeError("TemplateError: " + message + " (key '" + key + "' in '" + nodePath + "')"),
          m_key(std::move(key)), m_nodePath(std::move(nodePath)) {}

    const std::string& key() const { return m_key; }
    const std::string& nodePath() const { return m_nodePath; }

private:
    std::string m_key;
    std::string m_nodePath;
};

/** @brief An existing entry collides with a declared node under the active policy. */
class ConflictError : public TreeError {
public:
    ConflictError(std::string path, const std::string& message)
        : TreeError("ConflictError: " + message + ": " + path), m_path(std::move(path)) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/** @brief Underlying read/write/permission failure, wrapping the platform error. */
class IOError : public TreeError {
public:
    IOError(std::string path, std::error_code code, const std::string& operation)
        : TreeError("IOError: " + operation + " failed for '" + path + "': " + code.message()),
          m_path(std::move(path)), m_code(code) {}

    const std::string& path() const { return m_path; }
    std::error_code code() const { return m_code; }

private:
    std::string m_path;
    std::error_code m_code;
};

} // namespace dirtree::domain
