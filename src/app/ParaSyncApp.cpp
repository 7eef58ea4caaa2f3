/**
 * @file ParaSyncApp.cpp
 * @brief Implementation of the ParaSyncApp class.
 */
#include "app/ParaSyncApp.hpp"

#include "application/sync/ItemExecutor.hpp"
#include "application/sync/JobController.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/sync/FuseMountMonitor.hpp"
#include "infrastructure/sync/JobRepositoryFs.hpp"
#include "infrastructure/sync/RsyncCopyExecutor.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

#include <pthread.h>

namespace parasync::app {

using namespace parasync::domain::sync;
using application::sync::ControllerSettings;
using application::sync::CreateJobRequest;
using application::sync::ItemExecutor;
using application::sync::JobController;
using application::sync::JobListener;

namespace fs = std::filesystem;

namespace {

bool IsUnder(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    auto p = fs::path(path).lexically_normal();
    auto r = fs::path(root).lexically_normal();
    auto mismatch = std::mismatch(r.begin(), r.end(), p.begin(), p.end());
    return mismatch.first == r.end();
}

int ExitCodeFor(JobState state) {
    switch (state) {
        case JobState::Completed: return 0;
        case JobState::CompletedWithErrors: return 2;
        default: return 1;
    }
}

} // namespace

ParaSyncApp::ParaSyncApp() = default;

ParaSyncApp::~ParaSyncApp() {
    Shutdown();
}

void ParaSyncApp::PrintUsage() {
    std::cout << "Usage:\n"
              << "  parasync [--config FILE] serve\n"
              << "  parasync [--config FILE] run <source> <dest> [--parallel N] [--direction push|pull|bidirectional]\n"
              << "                                [--exclude PATTERN]... [--mount-check] [--dry-run]\n";
}

CommandLine ParaSyncApp::ParseArgs(int argc, char** argv) {
    CommandLine cli;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
            return argv[++i];
        };

        if (arg == "--config") {
            cli.configPath = next(arg);
        } else if (arg == "--parallel" || arg == "-j") {
            try {
                cli.parallelism = std::stoi(next(arg));
            } catch (const std::logic_error&) {
                throw std::invalid_argument("--parallel expects a number");
            }
            if (cli.parallelism <= 0) throw std::invalid_argument("--parallel must be at least 1");
        } else if (arg == "--direction") {
            cli.direction = next(arg);
        } else if (arg == "--exclude") {
            cli.excludes.push_back(next(arg));
        } else if (arg == "--mount-check") {
            cli.mountCheck = true;
        } else if (arg == "--dry-run") {
            cli.dryRun = true;
        } else if (arg == "-h" || arg == "--help") {
            cli.command = "help";
            return cli;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty()) {
        cli.command = positional[0];
    }
    if (cli.command == "run") {
        if (positional.size() != 3) throw std::invalid_argument("run expects <source> <dest>");
        cli.sourcePath = positional[1];
        cli.destPath = positional[2];
    } else if (cli.command == "serve") {
        if (positional.size() > 1) throw std::invalid_argument("serve takes no arguments");
    } else {
        throw std::invalid_argument("Unknown command: " + cli.command);
    }
    return cli;
}

int ParaSyncApp::Run(int argc, char** argv) {
    CommandLine cli;
    try {
        cli = ParseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ParaSyncApp] " << e.what() << std::endl;
        PrintUsage();
        return 64;
    }
    if (cli.command == "help") {
        PrintUsage();
        return 0;
    }

    // Signals are consumed by a dedicated thread; block them before any other thread starts.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    m_settings = infrastructure::ConfigLoader::Load(cli.configPath);

    if (cli.command == "serve") {
        if (!Init(true)) return 1;
        return Serve();
    }

    const bool touchesMount = IsUnder(cli.sourcePath, m_settings.mountPoint) ||
                              IsUnder(cli.destPath, m_settings.mountPoint);
    if (!Init(cli.mountCheck || touchesMount)) return 1;
    return RunOnce(cli);
}

bool ParaSyncApp::Init(bool forceMountCheck) {
    std::error_code ec;
    fs::create_directories(fs::path(m_settings.stateDir) / "jobs", ec);
    if (ec) {
        std::cerr << "[ParaSyncApp] Cannot create state dir " << m_settings.stateDir << ": " << ec.message() << std::endl;
        return false;
    }

    m_persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repository = std::make_shared<infrastructure::sync::JobRepositoryFs>(m_settings.stateDir, m_persistence);
    auto copyExecutor = std::make_shared<infrastructure::sync::RsyncCopyExecutor>(
        m_settings.rsyncBinary, std::chrono::milliseconds(m_settings.stopGraceMs));
    auto itemExecutor = std::make_shared<ItemExecutor>(copyExecutor);

    m_mountMonitor = std::make_shared<infrastructure::sync::FuseMountMonitor>(
        m_settings.mountPoint, m_settings.requireMountEntry);

    ControllerSettings controllerSettings;
    controllerSettings.defaultParallelism = m_settings.defaultParallelism;
    controllerSettings.copyOptions = m_settings.rsyncOptions;
    controllerSettings.defaultExcludes = {m_settings.defaultExcludes.begin(), m_settings.defaultExcludes.end()};
    controllerSettings.logDir = m_settings.logDir;
    controllerSettings.persistInterval = std::chrono::milliseconds(m_settings.persistIntervalMs);

    try {
        m_controller = std::make_shared<JobController>(repository, itemExecutor,
                                                       forceMountCheck ? m_mountMonitor : nullptr,
                                                       controllerSettings);
    } catch (const std::exception& e) {
        std::cerr << "[ParaSyncApp] Failed to initialize job controller: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[ParaSyncApp] State dir: " << m_settings.stateDir << ", mount: " << m_settings.mountPoint
              << " (" << MountStatusToString(m_mountMonitor->status()) << ")" << std::endl;
    return true;
}

int ParaSyncApp::Serve() {
    m_server = std::make_unique<infrastructure::HttpApiServer>(m_controller, m_mountMonitor);

    std::thread signalThread([this]() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            std::cout << "[ParaSyncApp] Received signal " << sig << ", shutting down" << std::endl;
            m_server->stop();
        }
    });

    bool ok = m_server->listen(m_settings.httpHost, m_settings.httpPort);
    if (!ok) {
        // Wake the signal thread so it can be joined.
        pthread_kill(signalThread.native_handle(), SIGTERM);
    }
    signalThread.join();

    Shutdown();
    return ok ? 0 : 1;
}

int ParaSyncApp::RunOnce(const CommandLine& cli) {
    CreateJobRequest request;
    request.name = fs::path(cli.sourcePath).filename().string();
    request.sourcePath = cli.sourcePath;
    request.destPath = cli.destPath;
    if (cli.parallelism > 0) request.parallelism = cli.parallelism;
    if (!cli.excludes.empty()) request.excludePatterns = std::set<std::string>(cli.excludes.begin(), cli.excludes.end());

    std::string jobId;
    try {
        request.direction = JobController::parseDirection(cli.direction);
        jobId = m_controller->createJob(request);
        if (cli.dryRun) {
            int code = PrintDryRun(jobId);
            Shutdown();
            return code;
        }
        m_controller->subscribe(JobListener{
            nullptr,
            [jobId](const std::string& id, const ProgressSnapshot& snapshot) {
                if (id != jobId) return;
                std::cout << "[ParaSyncApp] " << snapshot.filesDone << "/" << snapshot.totalFiles << " files, "
                          << static_cast<int>(snapshot.percentComplete()) << "%, "
                          << snapshot.activeWorkers << " active workers" << std::endl;
            }});
        m_controller->startJob(jobId);
    } catch (const ConfigError& e) {
        std::cerr << "[ParaSyncApp] Invalid job: " << e.what() << std::endl;
        return 64;
    }

    std::thread signalThread([this, jobId]() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        int sig = 0;
        if (sigwait(&signals, &sig) == 0 && m_controller->hasLiveRun(jobId)) {
            std::cout << "[ParaSyncApp] Cancelling, stopping in-flight copies" << std::endl;
            try {
                m_controller->cancelJob(jobId);
            } catch (const InvalidTransition& e) {
                std::cerr << "[ParaSyncApp] " << e.what() << std::endl;
            }
        }
    });

    while (!m_controller->waitForRun(jobId, std::chrono::seconds(1))) {
    }
    pthread_kill(signalThread.native_handle(), SIGTERM);
    signalThread.join();

    Job job = m_controller->getJobStatus(jobId);
    std::cout << "[ParaSyncApp] Job " << job.id << ": " << StateToString(job.state);
    if (!job.failureReason.empty()) std::cout << " (" << job.failureReason << ")";
    std::cout << std::endl;
    for (const auto& error : job.errors) {
        std::cerr << "  " << PhaseToString(error.phase) << " worker " << error.workerIndex << " " << error.item
                  << ": " << error.message << std::endl;
    }
    if (!job.filenameIssues.empty()) {
        std::cerr << "  " << job.filenameIssues.size() << " file name warning(s)" << std::endl;
    }

    Shutdown();
    return ExitCodeFor(job.state);
}

int ParaSyncApp::PrintDryRun(const std::string& jobId) {
    int code = 0;
    try {
        DryRunReport report = m_controller->dryRunJob(jobId);
        for (const auto& plan : report.phases) {
            std::cout << "[ParaSyncApp] Dry run " << PhaseToString(plan.phase) << ": " << plan.sourcePath
                      << " -> " << plan.destPath << "\n"
                      << "  " << plan.totalFiles << " files, " << plan.totalBytes << " bytes in source, "
                      << plan.assignments.size() << " worker(s)\n"
                      << "  " << plan.filesToTransfer << " to transfer (" << plan.bytesToTransfer << " bytes), "
                      << plan.filesToDelete << " to delete" << std::endl;
            for (const auto& change : plan.changes) {
                std::cout << "  " << change.action << " " << change.path << (change.isDirectory ? "/" : "") << std::endl;
            }
            for (const auto& line : plan.toolErrors) {
                std::cerr << "  " << line << std::endl;
            }
            if (!plan.filenameIssues.empty()) {
                std::cerr << "  " << plan.filenameIssues.size() << " file name warning(s)" << std::endl;
            }
            if (plan.toolExitCode != 0) code = 2;
        }
    } catch (const ScanError& e) {
        std::cerr << "[ParaSyncApp] Dry run failed: " << e.what() << std::endl;
        code = 1;
    } catch (const MountUnavailable& e) {
        std::cerr << "[ParaSyncApp] Dry run failed: " << e.what() << std::endl;
        code = 1;
    }
    m_controller->deleteJob(jobId);
    return code;
}

void ParaSyncApp::Shutdown() {
    m_server.reset();
    if (m_controller) {
        m_controller->shutdown();
        m_controller.reset();
    }
    if (m_persistence) {
        m_persistence->stop();
        m_persistence.reset();
    }
}

} // namespace parasync::app
