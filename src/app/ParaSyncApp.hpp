/**
 * @file ParaSyncApp.hpp
 * @brief Main application class for ParaSync.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"

namespace parasync::infrastructure {
class PersistenceService;
class HttpApiServer;
}

namespace parasync::domain::sync {
class MountMonitor;
}

namespace parasync::application::sync {
class JobController;
}

namespace parasync::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments.
 */
struct CommandLine {
    std::string command = "serve"; ///< "serve", "run" or "help".
    std::string configPath;
    std::string sourcePath;
    std::string destPath;
    std::string direction = "push";
    int parallelism = 0; ///< 0 keeps the configured default.
    std::vector<std::string> excludes;
    bool mountCheck = false;
    bool dryRun = false; ///< run: report the plan instead of copying.
};

/**
 * @class ParaSyncApp
 * @brief Wires the services together and runs either the API server or a single job.
 */
class ParaSyncApp {
public:
    ParaSyncApp();
    ~ParaSyncApp();

    /**
     * @brief Parses arguments and runs the selected command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses argv. @throws std::invalid_argument on bad usage.
     */
    static CommandLine ParseArgs(int argc, char** argv);

    static void PrintUsage();

private:
    /**
     * @brief Constructs persistence, repository and controller from the loaded settings.
     * @param forceMountCheck Consult the mount monitor before every phase.
     */
    bool Init(bool forceMountCheck);

    int Serve();
    int RunOnce(const CommandLine& cli);
    int PrintDryRun(const std::string& jobId);

    /**
     * @brief Stops the controller and flushes pending writes.
     */
    void Shutdown();

    infrastructure::SyncSettings m_settings;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::shared_ptr<domain::sync::MountMonitor> m_mountMonitor;
    std::shared_ptr<application::sync::JobController> m_controller;
    std::unique_ptr<infrastructure::HttpApiServer> m_server;
};

} // namespace parasync::app
