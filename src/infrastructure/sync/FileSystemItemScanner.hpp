/**
 * @file FileSystemItemScanner.hpp
 * @brief Scanner that turns a source root into top-level work items.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "domain/sync/Item.hpp"

namespace parasync::infrastructure::sync {

/**
 * @struct ScanResult
 * @brief Items one level below the root plus recursive totals.
 */
struct ScanResult {
    std::vector<domain::sync::Item> items; ///< Sorted by name.
    std::uint64_t totalFiles = 0;
    std::uint64_t totalBytes = 0;
    std::size_t skippedEntries = 0; ///< Unreadable entries below the top level.

    /** @brief The root had no (non-excluded) entries. Not an error. */
    bool empty() const { return items.empty(); }
};

/**
 * @class FileSystemItemScanner
 * @brief Infrastructure adapter that pre-scans a source tree.
 *
 * Each entry directly under the root becomes one Item. Directory items are
 * sized by a full recursive walk that never follows symlinks, so the walk
 * stays inside the root.
 */
class FileSystemItemScanner {
public:
    explicit FileSystemItemScanner(std::set<std::string> excludePatterns = {});

    /**
     * @brief Scans rootPath.
     * @throws domain::sync::ScanError NotFound if rootPath is missing or not a directory,
     *         PermissionDenied if it cannot be listed.
     */
    ScanResult scan(const std::string& rootPath) const;

    /** @brief Glob match of a single path component against the exclude set. */
    bool isExcluded(const std::string& name) const;

private:
    std::set<std::string> m_excludePatterns;

    domain::sync::Item measure(const std::string& entryPath, const std::string& name,
                               std::size_t& skipped) const;
};

} // namespace parasync::infrastructure::sync
