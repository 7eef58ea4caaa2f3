/**
 * @file FileSystemItemScanner.cpp
 * @brief Implementation of the FileSystemItemScanner.
 */

#include "infrastructure/sync/FileSystemItemScanner.hpp"
#include "domain/sync/SyncErrors.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <fnmatch.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace parasync::infrastructure::sync {

using domain::sync::Item;
using domain::sync::ScanError;

namespace {

// Size as reported by lstat: symlinks and special files count as themselves.
std::uint64_t ReportedSize(const fs::path& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return 0;
    }
    return st.st_size > 0 ? static_cast<std::uint64_t>(st.st_size) : 0;
}

} // namespace

FileSystemItemScanner::FileSystemItemScanner(std::set<std::string> excludePatterns)
    : m_excludePatterns(std::move(excludePatterns)) {}

bool FileSystemItemScanner::isExcluded(const std::string& name) const {
    for (const auto& pattern : m_excludePatterns) {
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

ScanResult FileSystemItemScanner::scan(const std::string& rootPath) const {
    std::error_code ec;
    auto rootStatus = fs::status(rootPath, ec);
    if (ec || !fs::exists(rootStatus)) {
        throw ScanError(ScanError::Kind::NotFound, "Source path does not exist: " + rootPath);
    }
    if (!fs::is_directory(rootStatus)) {
        throw ScanError(ScanError::Kind::NotFound, "Source path is not a directory: " + rootPath);
    }

    fs::directory_iterator it(rootPath, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) {
            throw ScanError(ScanError::Kind::PermissionDenied, "Cannot list source path: " + rootPath);
        }
        throw ScanError(ScanError::Kind::NotFound, "Cannot open source path " + rootPath + ": " + ec.message());
    }

    std::vector<fs::directory_entry> entries;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (isExcluded(name)) continue;
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    ScanResult result;
    for (const auto& entry : entries) {
        Item item = measure(entry.path().string(), entry.path().filename().string(), result.skippedEntries);
        result.totalFiles += item.fileCount;
        result.totalBytes += item.sizeBytes;
        result.items.push_back(std::move(item));
    }

    if (result.skippedEntries > 0) {
        std::cerr << "[Scanner] Skipped " << result.skippedEntries << " unreadable entries under " << rootPath
                  << std::endl;
    }
    return result;
}

Item FileSystemItemScanner::measure(const std::string& entryPath, const std::string& name,
                                    std::size_t& skipped) const {
    Item item;
    item.relativePath = name;

    std::error_code ec;
    auto linkStatus = fs::symlink_status(entryPath, ec);
    if (ec) {
        ++skipped;
        return item;
    }

    if (!fs::is_directory(linkStatus)) {
        item.isDirectory = false;
        item.fileCount = 1;
        item.sizeBytes = ReportedSize(entryPath);
        return item;
    }

    item.isDirectory = true;
    fs::recursive_directory_iterator walker(entryPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        ++skipped;
        return item;
    }

    for (auto end = fs::recursive_directory_iterator(); walker != end; walker.increment(ec)) {
        if (ec) {
            ++skipped;
            ec.clear();
            continue;
        }
        const auto& entry = *walker;
        if (isExcluded(entry.path().filename().string())) {
            if (walker.recursion_pending()) walker.disable_recursion_pending();
            continue;
        }

        auto status = entry.symlink_status(ec);
        if (ec) {
            ++skipped;
            ec.clear();
            continue;
        }
        if (fs::is_directory(status)) continue;

        item.fileCount += 1;
        item.sizeBytes += ReportedSize(entry.path());
    }
    return item;
}

} // namespace parasync::infrastructure::sync
