/**
 * @file Batcher.cpp
 * @brief Implementation of Batcher.
 */

#include "application/sync/Batcher.hpp"
#include "domain/sync/SyncErrors.hpp"

#include <algorithm>
#include <numeric>
#include <string>

namespace parasync::application::sync {

using domain::sync::ConfigError;
using domain::sync::Item;
using domain::sync::WorkerAssignment;

std::vector<WorkerAssignment> Batcher::assign(const std::vector<Item>& items, int workerCount) {
    if (workerCount <= 0) {
        throw ConfigError(ConfigError::Kind::InvalidParallelism,
                          "Worker count must be at least 1, got " + std::to_string(workerCount));
    }

    std::vector<WorkerAssignment> assignments(static_cast<std::size_t>(workerCount));
    for (int i = 0; i < workerCount; ++i) {
        assignments[static_cast<std::size_t>(i)].workerIndex = i;
    }

    // Largest first; stable_sort keeps scan order among equal sizes.
    std::vector<std::size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&items](std::size_t a, std::size_t b) {
        return items[a].sizeBytes > items[b].sizeBytes;
    });

    for (std::size_t idx : order) {
        // min_element returns the first minimum, i.e. the lowest worker index on ties.
        auto target = std::min_element(assignments.begin(), assignments.end(),
            [](const WorkerAssignment& a, const WorkerAssignment& b) { return a.loadBytes < b.loadBytes; });
        target->add(items[idx]);
    }

    return assignments;
}

} // namespace parasync::application::sync
