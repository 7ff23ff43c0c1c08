/**
 * @file LocalFileSystem.hpp
 * @brief std::filesystem implementation of the FileSystemGateway.
 */

#pragma once

#include "domain/FileSystemGateway.hpp"

namespace dirtree::infrastructure {

/**
 * @class LocalFileSystem
 * @brief Operates on the host filesystem. File writes and link replacements go through a temp
 * entry and a rename.
 */
class LocalFileSystem : public domain::FileSystemGateway {
public:
    std::optional<domain::EntryStatus> status(const std::filesystem::path& path) override;
    void createDirectory(const std::filesystem::path& path) override;
    void writeFile(const std::filesystem::path& path, const std::string& content) override;
    std::optional<std::string> readFile(const std::filesystem::path& path, std::uintmax_t maxBytes) override;
    void createSymlink(const std::string& target, const std::filesystem::path& path) override;
    std::string readSymlink(const std::filesystem::path& path) override;
    void replaceSymlink(const std::string& target, const std::filesystem::path& path) override;
    std::vector<std::string> listDirectory(const std::filesystem::path& path) override;
    std::filesystem::path canonical(const std::filesystem::path& path) override;
};

} // namespace dirtree::infrastructure
