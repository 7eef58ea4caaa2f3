/**
 * @file Job.hpp
 * @brief Aggregate Root for one user-defined copy job.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/sync/Item.hpp"
#include "domain/sync/JobState.hpp"
#include "domain/sync/SyncErrors.hpp"

namespace parasync::domain::sync {

using Clock = std::chrono::system_clock;

/** @brief Failure reason recorded when a job found mid-run is loaded by a new process. */
inline constexpr const char* kIncompleteOnRestart = "IncompleteOnRestart";
inline constexpr const char* kMountUnavailable = "MountUnavailable";
inline constexpr const char* kDestinationUnwritable = "DestinationUnwritable";

/**
 * @struct JobError
 * @brief One failed item, with enough context to re-run just that subset.
 */
struct JobError {
    int workerIndex = -1; ///< -1 for job-level errors.
    std::string item;
    std::string message;
    Clock::time_point timestamp;
    SyncPhase phase = SyncPhase::Push; ///< Phase the failure happened in.
};

/**
 * @struct FilenameIssue
 * @brief A source name likely to be rejected or mangled by the destination filesystem.
 */
struct FilenameIssue {
    std::string relativePath;
    bool isDirectory = false;
    std::string issueType; ///< "colon", "control_char", "trailing_space", "too_long", ...
};

/**
 * @struct RunStats
 * @brief Summary of the most recent run.
 */
struct RunStats {
    double durationSeconds = 0.0;
    std::uint64_t filesSynced = 0;
    std::uint64_t bytesSynced = 0;
    std::uint64_t errorCount = 0;
};

/**
 * @struct ProgressCounters
 * @brief Last known aggregate counters, persisted so progress survives a restart.
 */
struct ProgressCounters {
    std::uint64_t totalFiles = 0;
    std::uint64_t filesDone = 0;
    std::uint64_t totalBytes = 0;
    std::uint64_t bytesDone = 0;
};

/**
 * @class Job
 * @brief Durable description and lifecycle record of a copy job.
 *
 * Only JobController mutates a Job. All state changes go through transitionTo().
 */
class Job {
public:
    std::string id;
    std::string name;
    std::string sourcePath;
    std::string destPath;
    SyncDirection direction = SyncDirection::Push;
    int parallelism = 4;
    std::set<std::string> excludePatterns;
    std::string copyOptions; ///< Transfer flags handed to the copy tool.

    JobState state = JobState::Created;
    std::string failureReason;
    SyncPhase phase = SyncPhase::Push;

    Clock::time_point createdAt;
    std::optional<Clock::time_point> startedAt;
    std::optional<Clock::time_point> finishedAt;

    std::map<SyncPhase, std::vector<WorkerAssignment>> workerAssignments; ///< Plan of each phase run so far.
    std::vector<JobError> errors;
    std::vector<FilenameIssue> filenameIssues;
    ProgressCounters progress;

    std::optional<RunStats> lastRunStats;
    std::uint64_t runCount = 0;
    std::uint64_t totalFilesSynced = 0;
    std::uint64_t totalBytesSynced = 0;
    double totalRunSeconds = 0.0;

    /**
     * @brief Moves the job to a new state.
     * @throws InvalidTransition if the lifecycle does not allow it.
     */
    void transitionTo(JobState target, const std::string& reason = "") {
        if (!CanTransition(state, target)) {
            throw InvalidTransition("Job " + id + ": cannot go from " + StateToString(state) +
                                    " to " + StateToString(target));
        }
        state = target;

        if (target == JobState::Scanning) {
            resetRun();
            startedAt = Clock::now();
        }
        if (target == JobState::Failed) {
            failureReason = reason;
        }
        if (IsTerminal(target)) {
            finishedAt = Clock::now();
        }
    }

    /**
     * @brief Applies the restart reconciliation rule.
     * @return True if the job was mid-run and is now Failed{IncompleteOnRestart}.
     */
    bool reconcileAfterRestart() {
        if (!IsActive(state)) return false;
        transitionTo(JobState::Failed, kIncompleteOnRestart);
        errors.push_back(JobError{-1, "", "Run interrupted by process restart; in-flight transfers cannot be resumed",
                                  Clock::now(), phase});
        return true;
    }

    void recordItemError(SyncPhase itemPhase, int workerIndex, const std::string& item, const std::string& message) {
        errors.push_back(JobError{workerIndex, item, message, Clock::now(), itemPhase});
    }

    std::size_t itemErrorCount() const {
        std::size_t n = 0;
        for (const auto& e : errors) {
            if (e.workerIndex >= 0) ++n;
        }
        return n;
    }

private:
    void resetRun() {
        failureReason.clear();
        phase = direction == SyncDirection::Pull ? SyncPhase::Pull : SyncPhase::Push;
        finishedAt.reset();
        workerAssignments.clear();
        errors.clear();
        filenameIssues.clear();
        progress = ProgressCounters{};
    }
};

} // namespace parasync::domain::sync
