/**
 * @file Batcher.hpp
 * @brief Greedy longest-processing-time-first assignment of items to workers.
 */

#pragma once

#include <vector>

#include "domain/sync/Item.hpp"

namespace parasync::application::sync {

/**
 * @class Batcher
 * @brief Splits scanned items across a fixed number of workers to minimise the largest load.
 *
 * Items are taken largest first (ties in scan order) and each goes to the
 * currently least loaded worker (ties to the lowest index). The result is
 * within 4/3 of the optimal makespan. A single item larger than all others
 * combined is still the bottleneck; pre-split such directories.
 */
class Batcher {
public:
    /**
     * @brief Computes the assignment.
     * @return Exactly workerCount assignments, some possibly empty.
     * @throws domain::sync::ConfigError InvalidParallelism if workerCount <= 0.
     */
    static std::vector<domain::sync::WorkerAssignment> assign(const std::vector<domain::sync::Item>& items,
                                                              int workerCount);
};

} // namespace parasync::application::sync
