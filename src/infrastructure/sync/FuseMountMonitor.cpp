#include "infrastructure/sync/FuseMountMonitor.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include <dirent.h>
#include <sys/stat.h>

namespace parasync::infrastructure::sync {

using domain::sync::MountStatus;

namespace {

std::string WithoutTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

} // namespace

FuseMountMonitor::FuseMountMonitor(std::string mountPoint, bool requireMountEntry, std::string mountsFile)
    : m_mountPoint(WithoutTrailingSlash(std::move(mountPoint)))
    , m_requireMountEntry(requireMountEntry)
    , m_mountsFile(std::move(mountsFile)) {}

bool FuseMountMonitor::isListedInMountTable() const {
    std::ifstream mounts(m_mountsFile);
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device, target;
        if (fields >> device >> target && target == m_mountPoint) {
            return true;
        }
    }
    return false;
}

MountStatus FuseMountMonitor::status() {
    struct stat st {};
    if (::stat(m_mountPoint.c_str(), &st) != 0) {
        if (errno == ENOTCONN) return MountStatus::Disconnected;
        if (errno == ESTALE) return MountStatus::Stale;
        return MountStatus::Missing;
    }

    DIR* dir = ::opendir(m_mountPoint.c_str());
    if (!dir) {
        if (errno == ENOTCONN) return MountStatus::Disconnected;
        if (errno == ESTALE) return MountStatus::Stale;
        return MountStatus::NotMounted;
    }
    ::closedir(dir);

    if (m_requireMountEntry && !isListedInMountTable()) {
        return MountStatus::NotMounted;
    }
    return MountStatus::Available;
}

} // namespace parasync::infrastructure::sync
