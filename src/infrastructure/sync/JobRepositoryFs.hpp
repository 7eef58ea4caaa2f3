/**
 * @file JobRepositoryFs.hpp
 * @brief File system implementation of the Job repository.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/sync/JobRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace parasync::infrastructure::sync {

/**
 * @class JobRepositoryFs
 * @brief Stores one JSON document per job under <stateDir>/jobs/<id>.json.
 *
 * Writes go through PersistenceService (temp file + rename), so a crash never
 * leaves a half-written record.
 */
class JobRepositoryFs : public domain::sync::JobRepository {
public:
    JobRepositoryFs(std::string stateDir, std::shared_ptr<PersistenceService> persistence);

    void save(const domain::sync::Job& job, bool durable) override;
    std::optional<domain::sync::Job> findById(const std::string& id) override;
    std::vector<domain::sync::Job> findAll() override;
    void remove(const std::string& id) override;

private:
    std::string m_stateDir;
    std::shared_ptr<PersistenceService> m_persistence;

    std::string getJobFilePath(const std::string& id) const;
    std::string getJobsDir() const;
};

} // namespace parasync::infrastructure::sync
