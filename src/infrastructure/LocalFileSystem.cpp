/**
 * @file LocalFileSystem.cpp
 * @brief Implementation of LocalFileSystem.
 */

#include "infrastructure/LocalFileSystem.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <sstream>

#include "domain/TreeErrors.hpp"

namespace dirtree::infrastructure {

namespace fs = std::filesystem;
using domain::IOError;

namespace {

std::error_code LastErrno() {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

// Sibling of path: path.<timestamp>.tmp
fs::path TempSibling(const fs::path& path) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";
    return tempPath;
}

} // namespace

std::optional<domain::EntryStatus> LocalFileSystem::status(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            return std::nullopt;
        }
        throw IOError(path.string(), ec, "stat");
    }

    domain::EntryStatus result;
    switch (st.type()) {
        case fs::file_type::not_found:
            return std::nullopt;
        case fs::file_type::directory:
            result.kind = domain::NodeKind::Directory;
            break;
        case fs::file_type::symlink:
            result.kind = domain::NodeKind::Symlink;
            break;
        case fs::file_type::regular:
            result.kind = domain::NodeKind::File;
            break;
        default:
            result.kind = domain::NodeKind::File;
            result.regular = false;
            break;
    }
    return result;
}

void LocalFileSystem::createDirectory(const fs::path& path) {
    std::error_code ec;
    fs::create_directory(path, ec);
    if (ec) throw IOError(path.string(), ec, "create directory");
}

void LocalFileSystem::writeFile(const fs::path& path, const std::string& content) {
    // Temp file beside the target, then rename over the target.
    const fs::path tempPath = TempSibling(path);

    {
        errno = 0;
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw IOError(path.string(), LastErrno(), "open for writing");
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            std::error_code code = LastErrno();
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw IOError(path.string(), code, "write");
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw IOError(path.string(), ec, "rename");
    }
}

std::optional<std::string> LocalFileSystem::readFile(const fs::path& path, std::uintmax_t maxBytes) {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) throw IOError(path.string(), ec, "stat");
    if (size > maxBytes) return std::nullopt;

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError(path.string(), LastErrno(), "open for reading");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IOError(path.string(), LastErrno(), "read");
    }
    std::string content = buffer.str();
    // The file may have grown since the size check.
    if (content.size() > maxBytes) return std::nullopt;
    return content;
}

void LocalFileSystem::createSymlink(const std::string& target, const fs::path& path) {
    std::error_code ec;
    fs::create_symlink(fs::path(target), path, ec);
    if (ec) throw IOError(path.string(), ec, "create symlink");
}

std::string LocalFileSystem::readSymlink(const fs::path& path) {
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) throw IOError(path.string(), ec, "read symlink");
    return target.string();
}

void LocalFileSystem::replaceSymlink(const std::string& target, const fs::path& path) {
    const fs::path tempPath = TempSibling(path);
    std::error_code ec;
    fs::create_symlink(fs::path(target), tempPath, ec);
    if (ec) throw IOError(path.string(), ec, "create symlink");

    // rename(2) swaps the link in one step; a failure leaves the old entry untouched.
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw IOError(path.string(), ec, "replace symlink");
    }
}

std::vector<std::string> LocalFileSystem::listDirectory(const fs::path& path) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) throw IOError(path.string(), ec, "open directory");

    const fs::directory_iterator end;
    while (it != end) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) throw IOError(path.string(), ec, "read directory");
    }
    return names;
}

fs::path LocalFileSystem::canonical(const fs::path& path) {
    std::error_code ec;
    fs::path real = fs::canonical(path, ec);
    if (ec) throw IOError(path.string(), ec, "resolve");
    return real;
}

} // namespace dirtree::infrastructure
