/**
 * @file MountMonitor.hpp
 * @brief Interface to the mount/daemon collaborator.
 */

#pragma once

#include <string>

namespace parasync::domain::sync {

enum class MountStatus {
    Available,    ///< Mounted and readable.
    NotMounted,   ///< Path exists but nothing is mounted on it.
    Disconnected, ///< Transport endpoint is not connected.
    Stale,        ///< Stale file handle.
    Missing       ///< Mount point does not exist.
};

inline std::string MountStatusToString(MountStatus status) {
    switch (status) {
        case MountStatus::Available: return "available";
        case MountStatus::NotMounted: return "not-mounted";
        case MountStatus::Disconnected: return "disconnected";
        case MountStatus::Stale: return "stale";
        case MountStatus::Missing: return "missing";
        default: return "unknown";
    }
}

/**
 * @class MountMonitor
 * @brief Reports whether the remote-backed path can currently be used.
 */
class MountMonitor {
public:
    virtual ~MountMonitor() = default;

    virtual MountStatus status() = 0;

    /** @brief Path being monitored, for messages. */
    virtual std::string mountPoint() const = 0;
};

} // namespace parasync::domain::sync
