/**
 * @file Item.hpp
 * @brief Value objects for scanned work units and their worker assignments.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parasync::domain::sync {

/**
 * @struct Item
 * @brief One top-level entry under a scan root, copied as an indivisible unit.
 */
struct Item {
    std::string relativePath;   ///< Name relative to the scan root.
    std::uint64_t sizeBytes = 0; ///< Recursive byte size (lstat sizes, links not followed).
    std::uint64_t fileCount = 0; ///< 1 for a file, recursive non-directory count for a directory.
    bool isDirectory = false;

    bool operator==(const Item& other) const {
        return relativePath == other.relativePath &&
               sizeBytes == other.sizeBytes &&
               fileCount == other.fileCount &&
               isDirectory == other.isDirectory;
    }
};

/**
 * @struct WorkerAssignment
 * @brief Ordered queue of items for one worker lane.
 *
 * loadBytes always equals the sum of items[i].sizeBytes. Use add() to keep it so.
 */
struct WorkerAssignment {
    int workerIndex = 0;
    std::vector<Item> items;
    std::uint64_t loadBytes = 0;

    void add(const Item& item) {
        items.push_back(item);
        loadBytes += item.sizeBytes;
    }

    std::uint64_t fileCount() const {
        std::uint64_t total = 0;
        for (const auto& item : items) total += item.fileCount;
        return total;
    }
};

} // namespace parasync::domain::sync
