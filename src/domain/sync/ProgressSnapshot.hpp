/**
 * @file ProgressSnapshot.hpp
 * @brief Point-in-time view of a running job's combined progress.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace parasync::domain::sync {

enum class WorkerState {
    Pending,
    Running,
    Completed,
    Failed,   ///< Finished, at least one of its items failed.
    Cancelled
};

inline std::string WorkerStateToString(WorkerState state) {
    switch (state) {
        case WorkerState::Pending: return "pending";
        case WorkerState::Running: return "running";
        case WorkerState::Completed: return "completed";
        case WorkerState::Failed: return "failed";
        case WorkerState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

struct WorkerProgress {
    std::string currentItem; ///< Empty when idle.
    std::uint64_t itemsDone = 0;
    std::uint64_t itemsTotal = 0;
    std::uint64_t bytesInFlight = 0; ///< Bytes reported for the current item so far.
    std::string rate;
    WorkerState state = WorkerState::Pending;
};

/**
 * @struct ProgressSnapshot
 * @brief Consistent copy of the aggregate counters. Never persisted as-is.
 *
 * filesDone and bytesDone count items that completed successfully. Bytes
 * reported mid-item are visible per worker only, so the totals never exceed
 * totalFiles/totalBytes.
 */
struct ProgressSnapshot {
    std::uint64_t totalFiles = 0;
    std::uint64_t filesDone = 0;
    std::uint64_t totalBytes = 0;
    std::uint64_t bytesDone = 0;
    std::map<int, WorkerProgress> perWorker;
    int activeWorkers = 0;

    double percentComplete() const {
        if (totalBytes == 0) return filesDone >= totalFiles ? 100.0 : 0.0;
        return static_cast<double>(bytesDone) * 100.0 / static_cast<double>(totalBytes);
    }
};

} // namespace parasync::domain::sync
