/**
 * @file JobRepository.hpp
 * @brief Interface for persisting job records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/sync/Job.hpp"

namespace parasync::domain::sync {

class JobRepository {
public:
    virtual ~JobRepository() = default;

    // Writes the full record, replacing any previous version.
    // durable=true returns only once the record is on disk.
    virtual void save(const Job& job, bool durable) = 0;

    virtual std::optional<Job> findById(const std::string& id) = 0;

    // All stored jobs, oldest first
    virtual std::vector<Job> findAll() = 0;

    virtual void remove(const std::string& id) = 0;
};

} // namespace parasync::domain::sync
