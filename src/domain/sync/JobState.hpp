/**
 * @file JobState.hpp
 * @brief Value objects describing a job's lifecycle stage and copy direction.
 */

#pragma once

#include <optional>
#include <string>

namespace parasync::domain::sync {

/**
 * @enum JobState
 * @brief Lifecycle stage of a copy job.
 */
enum class JobState {
    Created,             ///< Defined, never started.
    Scanning,            ///< Pre-scan and batching in progress.
    Running,             ///< Workers are executing items.
    Paused,              ///< No new items are dispatched.
    Completed,           ///< All items copied.
    CompletedWithErrors, ///< Run finished, at least one item failed.
    Failed,              ///< Setup error or reconciliation outcome.
    Cancelled            ///< Stopped by the operator.
};

/**
 * @enum SyncDirection
 * @brief Which way a job copies.
 */
enum class SyncDirection {
    Push,         ///< source -> destination
    Pull,         ///< destination -> source
    Bidirectional ///< push phase, then pull phase
};

/**
 * @enum SyncPhase
 * @brief The direction currently being executed inside a job run.
 */
enum class SyncPhase {
    Push,
    Pull
};

inline std::string StateToString(JobState state) {
    switch (state) {
        case JobState::Created: return "Created";
        case JobState::Scanning: return "Scanning";
        case JobState::Running: return "Running";
        case JobState::Paused: return "Paused";
        case JobState::Completed: return "Completed";
        case JobState::CompletedWithErrors: return "CompletedWithErrors";
        case JobState::Failed: return "Failed";
        case JobState::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

inline std::optional<JobState> StateFromString(const std::string& value) {
    if (value == "Created") return JobState::Created;
    if (value == "Scanning") return JobState::Scanning;
    if (value == "Running") return JobState::Running;
    if (value == "Paused") return JobState::Paused;
    if (value == "Completed") return JobState::Completed;
    if (value == "CompletedWithErrors") return JobState::CompletedWithErrors;
    if (value == "Failed") return JobState::Failed;
    if (value == "Cancelled") return JobState::Cancelled;
    return std::nullopt;
}

inline std::string DirectionToString(SyncDirection direction) {
    switch (direction) {
        case SyncDirection::Push: return "push";
        case SyncDirection::Pull: return "pull";
        case SyncDirection::Bidirectional: return "bidirectional";
        default: return "unknown";
    }
}

/**
 * @brief Parses a direction name. Accepts the long deployment spellings as well.
 */
inline std::optional<SyncDirection> DirectionFromString(const std::string& value) {
    if (value == "push" || value == "local-to-filespace") return SyncDirection::Push;
    if (value == "pull" || value == "filespace-to-local") return SyncDirection::Pull;
    if (value == "bidirectional") return SyncDirection::Bidirectional;
    return std::nullopt;
}

inline std::string PhaseToString(SyncPhase phase) {
    return phase == SyncPhase::Push ? "push" : "pull";
}

inline std::optional<SyncPhase> PhaseFromString(const std::string& value) {
    if (value == "push") return SyncPhase::Push;
    if (value == "pull") return SyncPhase::Pull;
    return std::nullopt;
}

inline bool IsTerminal(JobState state) {
    return state == JobState::Completed ||
           state == JobState::CompletedWithErrors ||
           state == JobState::Failed ||
           state == JobState::Cancelled;
}

/** @brief True while a run owns live workers or is about to. */
inline bool IsActive(JobState state) {
    return state == JobState::Scanning ||
           state == JobState::Running ||
           state == JobState::Paused;
}

/**
 * @brief Checks whether the lifecycle permits moving from one state to another.
 */
inline bool CanTransition(JobState from, JobState to) {
    switch (to) {
        case JobState::Scanning:
            return from == JobState::Created || IsTerminal(from);
        case JobState::Running:
            return from == JobState::Scanning || from == JobState::Paused;
        case JobState::Paused:
            return from == JobState::Running;
        case JobState::Completed:
            return from == JobState::Scanning || from == JobState::Running || from == JobState::Paused;
        case JobState::CompletedWithErrors:
            return from == JobState::Running || from == JobState::Paused;
        case JobState::Failed:
            return IsActive(from);
        case JobState::Cancelled:
            return IsActive(from);
        case JobState::Created:
        default:
            return false;
    }
}

} // namespace parasync::domain::sync
