/**
 * @file JobRecordCodec.cpp
 * @brief Implementation of JobRecordCodec.
 */

#include "infrastructure/sync/JobRecordCodec.hpp"

#include <stdexcept>

namespace parasync::infrastructure::sync {

using json = nlohmann::json;
using namespace parasync::domain::sync;

namespace {

long long ToMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point FromMillis(long long ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

json OptionalMillis(const std::optional<Clock::time_point>& tp) {
    return tp ? json(ToMillis(*tp)) : json(nullptr);
}

std::optional<Clock::time_point> ReadOptionalMillis(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return FromMillis(j[key].get<long long>());
}

json ItemToJson(const Item& item) {
    return {
        {"path", item.relativePath},
        {"sizeBytes", item.sizeBytes},
        {"fileCount", item.fileCount},
        {"isDirectory", item.isDirectory}
    };
}

Item ItemFromJson(const json& j) {
    Item item;
    item.relativePath = j.at("path").get<std::string>();
    item.sizeBytes = j.value("sizeBytes", std::uint64_t{0});
    item.fileCount = j.value("fileCount", std::uint64_t{0});
    item.isDirectory = j.value("isDirectory", false);
    return item;
}

json AssignmentsToJson(const std::vector<WorkerAssignment>& assignments) {
    json out = json::array();
    for (const auto& a : assignments) {
        json items = json::array();
        for (const auto& item : a.items) items.push_back(ItemToJson(item));
        out.push_back({
            {"workerIndex", a.workerIndex},
            {"loadBytes", a.loadBytes},
            {"items", items}
        });
    }
    return out;
}

std::vector<WorkerAssignment> AssignmentsFromJson(const json& j) {
    std::vector<WorkerAssignment> out;
    for (const auto& a : j) {
        WorkerAssignment assignment;
        assignment.workerIndex = a.at("workerIndex").get<int>();
        for (const auto& item : a.value("items", json::array())) {
            assignment.add(ItemFromJson(item));
        }
        out.push_back(std::move(assignment));
    }
    return out;
}

json IssuesToJson(const std::vector<FilenameIssue>& filenameIssues) {
    json issues = json::array();
    for (const auto& issue : filenameIssues) {
        issues.push_back({
            {"path", issue.relativePath},
            {"isDirectory", issue.isDirectory},
            {"issueType", issue.issueType}
        });
    }
    return issues;
}

} // namespace

json JobRecordCodec::toJson(const Job& job) {
    json assignments = json::object();
    for (const auto& [phase, lanes] : job.workerAssignments) {
        assignments[PhaseToString(phase)] = AssignmentsToJson(lanes);
    }

    json errors = json::array();
    for (const auto& e : job.errors) {
        errors.push_back({
            {"workerIndex", e.workerIndex},
            {"item", e.item},
            {"message", e.message},
            {"ts", ToMillis(e.timestamp)},
            {"phase", PhaseToString(e.phase)}
        });
    }

    json issues = IssuesToJson(job.filenameIssues);

    json lastRun = nullptr;
    if (job.lastRunStats) {
        lastRun = {
            {"durationSeconds", job.lastRunStats->durationSeconds},
            {"filesSynced", job.lastRunStats->filesSynced},
            {"bytesSynced", job.lastRunStats->bytesSynced},
            {"errorCount", job.lastRunStats->errorCount}
        };
    }

    return {
        {"schemaVersion", kSchemaVersion},
        {"id", job.id},
        {"name", job.name},
        {"sourcePath", job.sourcePath},
        {"destPath", job.destPath},
        {"direction", DirectionToString(job.direction)},
        {"parallelism", job.parallelism},
        {"excludePatterns", job.excludePatterns},
        {"copyOptions", job.copyOptions},
        {"state", StateToString(job.state)},
        {"failureReason", job.failureReason},
        {"phase", PhaseToString(job.phase)},
        {"createdAt", ToMillis(job.createdAt)},
        {"startedAt", OptionalMillis(job.startedAt)},
        {"finishedAt", OptionalMillis(job.finishedAt)},
        {"workerAssignments", assignments},
        {"errors", errors},
        {"filenameIssues", issues},
        {"progress", {
            {"totalFiles", job.progress.totalFiles},
            {"filesDone", job.progress.filesDone},
            {"totalBytes", job.progress.totalBytes},
            {"bytesDone", job.progress.bytesDone}
        }},
        {"lastRunStats", lastRun},
        {"runCount", job.runCount},
        {"totalFilesSynced", job.totalFilesSynced},
        {"totalBytesSynced", job.totalBytesSynced},
        {"totalRunSeconds", job.totalRunSeconds}
    };
}

Job JobRecordCodec::fromJson(const json& j) {
    int version = j.value("schemaVersion", 0);
    if (version < 1 || version > kSchemaVersion) {
        throw std::runtime_error("Unsupported job record schema version: " + std::to_string(version));
    }

    Job job;
    job.id = j.at("id").get<std::string>();
    job.name = j.value("name", "");
    job.sourcePath = j.at("sourcePath").get<std::string>();
    job.destPath = j.at("destPath").get<std::string>();

    auto direction = DirectionFromString(j.value("direction", "push"));
    if (!direction) throw std::runtime_error("Unknown direction in job record " + job.id);
    job.direction = *direction;

    job.parallelism = j.value("parallelism", 4);
    job.excludePatterns = j.value("excludePatterns", std::set<std::string>{});
    job.copyOptions = j.value("copyOptions", "");

    auto state = StateFromString(j.value("state", "Created"));
    if (!state) throw std::runtime_error("Unknown state in job record " + job.id);
    job.state = *state;
    job.failureReason = j.value("failureReason", "");
    job.phase = j.value("phase", "push") == "pull" ? SyncPhase::Pull : SyncPhase::Push;

    job.createdAt = FromMillis(j.value("createdAt", 0LL));
    job.startedAt = ReadOptionalMillis(j, "startedAt");
    job.finishedAt = ReadOptionalMillis(j, "finishedAt");

    const json assignments = j.value("workerAssignments", json::object());
    if (assignments.is_array()) {
        // Version 1 kept only the latest phase's plan.
        if (!assignments.empty()) job.workerAssignments[job.phase] = AssignmentsFromJson(assignments);
    } else {
        for (const auto& [key, lanes] : assignments.items()) {
            auto phase = PhaseFromString(key);
            if (!phase) throw std::runtime_error("Unknown phase '" + key + "' in job record " + job.id);
            job.workerAssignments[*phase] = AssignmentsFromJson(lanes);
        }
    }

    for (const auto& e : j.value("errors", json::array())) {
        auto phase = PhaseFromString(e.value("phase", PhaseToString(job.phase)));
        if (!phase) throw std::runtime_error("Unknown error phase in job record " + job.id);
        job.errors.push_back(JobError{
            e.value("workerIndex", -1),
            e.value("item", ""),
            e.value("message", ""),
            FromMillis(e.value("ts", 0LL)),
            *phase
        });
    }

    for (const auto& issue : j.value("filenameIssues", json::array())) {
        job.filenameIssues.push_back(FilenameIssue{
            issue.value("path", ""),
            issue.value("isDirectory", false),
            issue.value("issueType", "")
        });
    }

    if (j.contains("progress") && j["progress"].is_object()) {
        const auto& p = j["progress"];
        job.progress.totalFiles = p.value("totalFiles", std::uint64_t{0});
        job.progress.filesDone = p.value("filesDone", std::uint64_t{0});
        job.progress.totalBytes = p.value("totalBytes", std::uint64_t{0});
        job.progress.bytesDone = p.value("bytesDone", std::uint64_t{0});
    }

    if (j.contains("lastRunStats") && j["lastRunStats"].is_object()) {
        const auto& s = j["lastRunStats"];
        RunStats stats;
        stats.durationSeconds = s.value("durationSeconds", 0.0);
        stats.filesSynced = s.value("filesSynced", std::uint64_t{0});
        stats.bytesSynced = s.value("bytesSynced", std::uint64_t{0});
        stats.errorCount = s.value("errorCount", std::uint64_t{0});
        job.lastRunStats = stats;
    }

    job.runCount = j.value("runCount", std::uint64_t{0});
    job.totalFilesSynced = j.value("totalFilesSynced", std::uint64_t{0});
    job.totalBytesSynced = j.value("totalBytesSynced", std::uint64_t{0});
    job.totalRunSeconds = j.value("totalRunSeconds", 0.0);
    return job;
}

json JobRecordCodec::toSummaryJson(const Job& job) {
    return {
        {"id", job.id},
        {"name", job.name},
        {"direction", DirectionToString(job.direction)},
        {"state", StateToString(job.state)},
        {"failureReason", job.failureReason},
        {"createdAt", ToMillis(job.createdAt)},
        {"finishedAt", OptionalMillis(job.finishedAt)},
        {"errorCount", job.errors.size()},
        {"runCount", job.runCount}
    };
}

json JobRecordCodec::toJson(const ProgressSnapshot& snapshot) {
    json workers = json::object();
    for (const auto& [index, w] : snapshot.perWorker) {
        workers[std::to_string(index)] = {
            {"currentItem", w.currentItem.empty() ? json(nullptr) : json(w.currentItem)},
            {"itemsDone", w.itemsDone},
            {"itemsTotal", w.itemsTotal},
            {"bytesInFlight", w.bytesInFlight},
            {"rate", w.rate},
            {"state", WorkerStateToString(w.state)}
        };
    }
    return {
        {"totalFiles", snapshot.totalFiles},
        {"filesDone", snapshot.filesDone},
        {"totalBytes", snapshot.totalBytes},
        {"bytesDone", snapshot.bytesDone},
        {"percentComplete", snapshot.percentComplete()},
        {"activeWorkers", snapshot.activeWorkers},
        {"perWorker", workers}
    };
}

json JobRecordCodec::toJson(const DryRunReport& report) {
    json phases = json::array();
    for (const auto& plan : report.phases) {
        json changes = json::array();
        for (const auto& change : plan.changes) {
            changes.push_back({
                {"path", change.path},
                {"isDirectory", change.isDirectory},
                {"action", change.action},
                {"sizeBytes", change.sizeBytes}
            });
        }
        phases.push_back({
            {"phase", PhaseToString(plan.phase)},
            {"sourcePath", plan.sourcePath},
            {"destPath", plan.destPath},
            {"totalFiles", plan.totalFiles},
            {"totalBytes", plan.totalBytes},
            {"workerAssignments", AssignmentsToJson(plan.assignments)},
            {"filenameIssues", IssuesToJson(plan.filenameIssues)},
            {"filesToTransfer", plan.filesToTransfer},
            {"filesToDelete", plan.filesToDelete},
            {"bytesToTransfer", plan.bytesToTransfer},
            {"changes", changes},
            {"toolErrors", plan.toolErrors},
            {"toolExitCode", plan.toolExitCode}
        });
    }
    return {
        {"jobId", report.jobId},
        {"jobName", report.jobName},
        {"phases", phases}
    };
}

} // namespace parasync::infrastructure::sync
