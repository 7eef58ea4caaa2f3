/**
 * @file DryRunReport.hpp
 * @brief What a job run would do, computed without starting workers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "domain/sync/Item.hpp"
#include "domain/sync/Job.hpp"
#include "domain/sync/JobState.hpp"

namespace parasync::domain::sync {

/**
 * @struct PlannedChange
 * @brief One entry the copy tool reported it would touch.
 */
struct PlannedChange {
    std::string path;
    bool isDirectory = false;
    std::string action; ///< "transfer", "update" or "delete"
    std::uint64_t sizeBytes = 0;
};

/**
 * @struct PhasePlan
 * @brief Preview of one phase: scan totals, worker plan and the tool's change list.
 */
struct PhasePlan {
    SyncPhase phase = SyncPhase::Push;
    std::string sourcePath;
    std::string destPath;

    std::uint64_t totalFiles = 0;
    std::uint64_t totalBytes = 0;
    std::vector<WorkerAssignment> assignments;
    std::vector<FilenameIssue> filenameIssues;

    std::vector<PlannedChange> changes;
    std::uint64_t filesToTransfer = 0; ///< transfer + update entries that are not directories
    std::uint64_t filesToDelete = 0;
    std::uint64_t bytesToTransfer = 0;
    std::vector<std::string> toolErrors;
    int toolExitCode = 0;
};

struct DryRunReport {
    std::string jobId;
    std::string jobName;
    std::vector<PhasePlan> phases;
};

} // namespace parasync::domain::sync
