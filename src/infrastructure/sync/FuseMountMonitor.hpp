#pragma once

#include "domain/sync/MountMonitor.hpp"
#include <string>

namespace parasync::infrastructure::sync {

/**
 * @class FuseMountMonitor
 * @brief Checks a FUSE-backed mount point via /proc/mounts and a directory listing.
 *
 * A disconnected FUSE mount fails the listing immediately (ENOTCONN), so the
 * check does not need a timeout.
 */
class FuseMountMonitor : public domain::sync::MountMonitor {
public:
    /**
     * @param mountPoint Path of the remote-backed mount.
     * @param requireMountEntry When false, a readable directory is enough (plain local trees).
     * @param mountsFile Mount table to consult.
     */
    explicit FuseMountMonitor(std::string mountPoint,
                              bool requireMountEntry = true,
                              std::string mountsFile = "/proc/mounts");

    domain::sync::MountStatus status() override;
    std::string mountPoint() const override { return m_mountPoint; }

    /** @brief True if the mount table lists mountPoint. */
    bool isListedInMountTable() const;

private:
    std::string m_mountPoint;
    bool m_requireMountEntry;
    std::string m_mountsFile;
};

} // namespace parasync::infrastructure::sync
