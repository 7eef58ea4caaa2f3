/**
 * @file SyncErrors.hpp
 * @brief Exception taxonomy for scheduling, scanning and job management.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace parasync::domain::sync {

/**
 * @class ConfigError
 * @brief Invalid job configuration. Raised before any work starts.
 */
class ConfigError : public std::runtime_error {
public:
    enum class Kind {
        InvalidParallelism,
        InvalidDirection,
        InvalidPath
    };

    ConfigError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

/**
 * @class ScanError
 * @brief Failure while enumerating a source root.
 *
 * An empty root is not an error; the scan simply yields no items.
 */
class ScanError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        PermissionDenied
    };

    ScanError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

inline std::string ScanErrorKindToString(ScanError::Kind kind) {
    switch (kind) {
        case ScanError::Kind::NotFound: return "NotFound";
        case ScanError::Kind::PermissionDenied: return "PermissionDenied";
        default: return "Unknown";
    }
}

/** @brief The remote-backed mount is not usable. */
class MountUnavailable : public std::runtime_error {
public:
    explicit MountUnavailable(const std::string& message) : std::runtime_error(message) {}
};

/** @brief The requested operation is not permitted in the job's current state. */
class InvalidTransition : public std::runtime_error {
public:
    explicit InvalidTransition(const std::string& message) : std::runtime_error(message) {}
};

class JobNotFound : public std::runtime_error {
public:
    explicit JobNotFound(const std::string& jobId) : std::runtime_error("Job not found: " + jobId) {}
};

} // namespace parasync::domain::sync
