/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading service configuration (settings.json plus environment).
 *
 * Provides a unified way to access configuration like the mount point or the
 * rsync flags without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>

namespace parasync::infrastructure {

/**
 * @struct SyncSettings
 * @brief Effective service configuration after file and environment overrides.
 */
struct SyncSettings {
    std::string stateDir;                       ///< Job records live under <stateDir>/jobs.
    std::string logDir;                         ///< errors.log is appended here.
    std::string mountPoint = "/data/filespace"; ///< Remote-backed mount.
    bool requireMountEntry = true;              ///< Require the mount point in /proc/mounts.
    int defaultParallelism = 4;
    std::string rsyncBinary = "rsync";
    std::string rsyncOptions = "-av";
    std::vector<std::string> defaultExcludes = {".DS_Store", "Thumbs.db", "*.tmp"};
    std::string httpHost = "0.0.0.0";
    int httpPort = 8080;
    int persistIntervalMs = 2000;
    int stopGraceMs = 5000;                     ///< SIGTERM to SIGKILL delay for a cancelled copy.
};

class ConfigLoader {
public:
    /**
     * @brief Default settings.json location ($XDG_CONFIG_HOME/ParaSync/settings.json).
     */
    static std::string DefaultConfigPath();

    /**
     * @brief Reads settings.json (if present) and then applies environment overrides.
     * @param configPath Path to settings.json; empty for the default location.
     */
    static SyncSettings Load(const std::string& configPath = "");

    /**
     * @brief Applies PARASYNC_* / deployment environment variables on top of settings.
     */
    static void ApplyEnvironment(SyncSettings& settings);

    /** @brief Splits "a,b, c" into {"a","b","c"}. */
    static std::vector<std::string> SplitList(const std::string& value, char separator = ',');
};

} // namespace parasync::infrastructure
