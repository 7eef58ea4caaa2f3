/**
 * @file JobRecordCodec.hpp
 * @brief JSON mapping of Job records and progress snapshots.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/sync/DryRunReport.hpp"
#include "domain/sync/Job.hpp"
#include "domain/sync/ProgressSnapshot.hpp"

namespace parasync::infrastructure::sync {

class JobRecordCodec {
public:
    /// Version 2 keys workerAssignments by phase; version 1 records are still read.
    static constexpr int kSchemaVersion = 2;

    static nlohmann::json toJson(const domain::sync::Job& job);

    /**
     * @brief Rebuilds a Job from its stored form.
     * @throws std::runtime_error / nlohmann::json::exception on malformed records.
     */
    static domain::sync::Job fromJson(const nlohmann::json& j);

    /** @brief Compact form used by ListJobs. */
    static nlohmann::json toSummaryJson(const domain::sync::Job& job);

    static nlohmann::json toJson(const domain::sync::ProgressSnapshot& snapshot);

    static nlohmann::json toJson(const domain::sync::DryRunReport& report);
};

} // namespace parasync::infrastructure::sync
