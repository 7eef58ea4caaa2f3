/**
 * @file ProgressAggregator.hpp
 * @brief Thread-safe accumulation of worker events into a progress snapshot.
 */

#pragma once

#include <mutex>
#include <vector>

#include "domain/sync/Item.hpp"
#include "domain/sync/ProgressSnapshot.hpp"
#include "domain/sync/WorkerEvents.hpp"

namespace parasync::application::sync {

/**
 * @class ProgressAggregator
 * @brief One writer per worker, any number of readers.
 *
 * Every event is applied under a single mutex, so a snapshot never shows a
 * partially applied event and no update is lost or counted twice.
 */
class ProgressAggregator {
public:
    ProgressAggregator() = default;

    /**
     * @brief Registers the assignments of a new phase.
     *
     * Phase totals are added to the running totals; per-worker state is reset.
     */
    void beginPhase(const std::vector<domain::sync::WorkerAssignment>& assignments);

    /** @brief Applies one worker event. Safe to call from any worker thread. */
    void apply(const domain::sync::WorkerEvent& event);

    /** @brief Returns a consistent copy. */
    domain::sync::ProgressSnapshot snapshot() const;

private:
    mutable std::mutex m_mutex;
    domain::sync::ProgressSnapshot m_snapshot;
    std::vector<bool> m_workerFailed;

    void recountActive();
};

} // namespace parasync::application::sync
