/**
 * @file FileSystemGateway.hpp
 * @brief Interface for the raw filesystem primitives used by the builder and the scanner.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "domain/Node.hpp"

namespace dirtree::domain {

/**
 * @struct EntryStatus
 * @brief Kind of an existing entry, obtained without following symlinks.
 */
struct EntryStatus {
    NodeKind kind = NodeKind::File;
    bool regular = true; ///< False for sockets, fifos and devices (reported as File).
};

/**
 * @class FileSystemGateway
 * @brief Abstract capability for reading and writing entries.
 *
 * Every method throws IOError on failure. Paths are absolute and have already been
 * checked by the PathResolver.
 */
class FileSystemGateway {
public:
    virtual ~FileSystemGateway() = default;

    /** @brief Status of @p path, or nullopt if nothing exists there. Does not follow symlinks. */
    virtual std::optional<EntryStatus> status(const std::filesystem::path& path) = 0;

    /** @brief Creates a single directory (the parent must exist). */
    virtual void createDirectory(const std::filesystem::path& path) = 0;

    /** @brief Creates or replaces a regular file with @p content. */
    virtual void writeFile(const std::filesystem::path& path, const std::string& content) = 0;

    /**
     * @brief Reads a regular file.
     * @return The content, or nullopt if the file is larger than @p maxBytes.
     */
    virtual std::optional<std::string> readFile(const std::filesystem::path& path, std::uintmax_t maxBytes) = 0;

    /** @brief Creates a symlink at @p path whose literal text is @p target. */
    virtual void createSymlink(const std::string& target, const std::filesystem::path& path) = 0;

    /** @brief Literal text of the symlink at @p path. */
    virtual std::string readSymlink(const std::filesystem::path& path) = 0;

    /**
     * @brief Points the existing entry at @p path to @p target.
     * The old entry stays in place if the new link cannot be created.
     */
    virtual void replaceSymlink(const std::string& target, const std::filesystem::path& path) = 0;

    /** @brief Names of the entries directly inside @p path, unsorted. */
    virtual std::vector<std::string> listDirectory(const std::filesystem::path& path) = 0;

    /** @brief Real path with every symlink resolved. */
    virtual std::filesystem::path canonical(const std::filesystem::path& path) = 0;
};

} // namespace dirtree::domain
