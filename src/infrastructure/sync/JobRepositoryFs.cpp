/**
 * @file JobRepositoryFs.cpp
 * @brief Implementation of JobRepositoryFs.
 */

#include "infrastructure/sync/JobRepositoryFs.hpp"
#include "infrastructure/sync/JobRecordCodec.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace parasync::infrastructure::sync {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::sync::Job;

JobRepositoryFs::JobRepositoryFs(std::string stateDir, std::shared_ptr<PersistenceService> persistence)
    : m_stateDir(std::move(stateDir)), m_persistence(std::move(persistence)) {}

std::string JobRepositoryFs::getJobsDir() const {
    // Structure: <stateDir>/jobs/<id>.json
    return (fs::path(m_stateDir) / "jobs").string();
}

std::string JobRepositoryFs::getJobFilePath(const std::string& id) const {
    return (fs::path(getJobsDir()) / (id + ".json")).string();
}

void JobRepositoryFs::save(const Job& job, bool durable) {
    // File names are not guaranteed to be valid UTF-8.
    m_persistence->saveTextAsync(getJobFilePath(job.id),
                                 JobRecordCodec::toJson(job).dump(2, ' ', false, json::error_handler_t::replace));
    if (durable && !m_persistence->flush()) {
        std::cerr << "[JobRepository] Durable save of job " << job.id << " failed" << std::endl;
    }
}

std::optional<Job> JobRepositoryFs::findById(const std::string& id) {
    std::string filepath = getJobFilePath(id);
    if (!fs::exists(filepath)) return std::nullopt;

    try {
        std::ifstream in(filepath);
        json j;
        in >> j;
        return JobRecordCodec::fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[JobRepository] Error reading " << filepath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<Job> JobRepositoryFs::findAll() {
    std::vector<Job> jobs;
    std::error_code ec;
    if (!fs::exists(getJobsDir(), ec)) return jobs;

    for (const auto& entry : fs::directory_iterator(getJobsDir(), ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        auto job = findById(entry.path().stem().string());
        if (!job) {
            // Keep the unreadable record aside for inspection instead of overwriting it later.
            fs::path corrupt = entry.path();
            corrupt += ".corrupted";
            std::error_code renameEc;
            fs::rename(entry.path(), corrupt, renameEc);
            std::cerr << "[JobRepository] Moved unreadable record to " << corrupt << std::endl;
            continue;
        }
        jobs.push_back(std::move(*job));
    }

    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return jobs;
}

void JobRepositoryFs::remove(const std::string& id) {
    // Let queued writes for this job land first so none recreates the file.
    if (!m_persistence->flush()) {
        std::cerr << "[JobRepository] Pending writes failed before removing job " << id << std::endl;
    }
    std::error_code ec;
    fs::remove(getJobFilePath(id), ec);
    if (ec) {
        std::cerr << "[JobRepository] Failed to remove job " << id << ": " << ec.message() << std::endl;
    }
}

} // namespace parasync::infrastructure::sync
