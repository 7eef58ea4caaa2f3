/**
 * @file JobController.hpp
 * @brief Owns every Job, drives its lifecycle and orchestrates runs.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/sync/ItemExecutor.hpp"
#include "application/sync/ProgressAggregator.hpp"
#include "application/sync/WorkerPool.hpp"
#include "domain/sync/DryRunReport.hpp"
#include "domain/sync/Job.hpp"
#include "domain/sync/JobRepository.hpp"
#include "domain/sync/MountMonitor.hpp"
#include "domain/sync/ProgressSnapshot.hpp"

namespace parasync::application::sync {

/** @brief Failure reason for unexpected errors while preparing a phase. */
inline constexpr const char* kSetupError = "SetupError";

/**
 * @struct ControllerSettings
 * @brief Defaults and cadence for the controller.
 */
struct ControllerSettings {
    int defaultParallelism = 4;
    std::string copyOptions = "-av";
    std::set<std::string> defaultExcludes;
    std::string logDir; ///< errors.log is appended here; empty disables the file.
    std::chrono::milliseconds persistInterval{2000};
};

/**
 * @struct CreateJobRequest
 * @brief Parameters of CreateJob. Unset optionals take the controller defaults.
 */
struct CreateJobRequest {
    std::string name;
    std::string sourcePath;
    std::string destPath;
    domain::sync::SyncDirection direction = domain::sync::SyncDirection::Push;
    std::optional<int> parallelism;
    std::optional<std::set<std::string>> excludePatterns;
    std::optional<std::string> copyOptions;
};

/**
 * @struct UpdateJobRequest
 * @brief Fields to overwrite on an idle job. Unset optionals keep the current value.
 */
struct UpdateJobRequest {
    std::optional<std::string> name; ///< Empty string falls back to the source directory name.
    std::optional<std::string> sourcePath;
    std::optional<std::string> destPath;
    std::optional<domain::sync::SyncDirection> direction;
    std::optional<int> parallelism;
    std::optional<std::set<std::string>> excludePatterns;
    std::optional<std::string> copyOptions;
};

/**
 * @struct JobListener
 * @brief Observer callbacks. Invoked without controller locks held, from any thread.
 */
struct JobListener {
    std::function<void(const domain::sync::Job&)> onStateChanged;
    std::function<void(const std::string& jobId, const domain::sync::ProgressSnapshot&)> onProgress;
};

/**
 * @class JobController
 * @brief Application service implementing the job state machine.
 *
 * The controller is the only writer of Job records. Each started job runs on a
 * background task; management calls only flip flags and states, so they never
 * wait for copy subprocesses.
 */
class JobController {
public:
    /**
     * @param mountMonitor May be null when no remote-backed mount is involved.
     */
    JobController(std::shared_ptr<domain::sync::JobRepository> repository,
                  std::shared_ptr<ItemExecutor> itemExecutor,
                  std::shared_ptr<domain::sync::MountMonitor> mountMonitor,
                  ControllerSettings settings);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    /**
     * @brief Validates and stores a new job in state Created.
     * @throws domain::sync::ConfigError on invalid parallelism or paths.
     */
    std::string createJob(const CreateJobRequest& request);

    /**
     * @brief Overwrites the given fields of a job that is not running.
     * @throws JobNotFound, InvalidTransition while a run is live, ConfigError like createJob.
     */
    domain::sync::Job updateJob(const std::string& jobId, const UpdateJobRequest& request);

    /**
     * @brief Scans, batches and asks the copy tool for its change list without copying.
     *
     * Runs on the caller's thread. Nothing is written to the destination.
     * @throws JobNotFound, InvalidTransition while a run is live, ScanError, MountUnavailable.
     */
    domain::sync::DryRunReport dryRunJob(const std::string& jobId);

    /**
     * @brief Starts a fresh run (re-scan, re-batch).
     * @throws JobNotFound, InvalidTransition if the job is active or still draining.
     */
    void startJob(const std::string& jobId);
    void pauseJob(const std::string& jobId);
    void resumeJob(const std::string& jobId);

    /**
     * @brief Stops dispatching items and terminates in-flight copies in the background.
     */
    void cancelJob(const std::string& jobId);

    /** @throws InvalidTransition if the job is active. */
    void deleteJob(const std::string& jobId);

    domain::sync::Job getJobStatus(const std::string& jobId) const;
    domain::sync::ProgressSnapshot getProgress(const std::string& jobId) const;

    /** @brief All jobs ordered by creation time. */
    std::vector<domain::sync::Job> listJobs() const;

    int subscribe(JobListener listener);
    void unsubscribe(int subscriptionId);

    /** @brief True while a run task for the job has not finished. */
    bool hasLiveRun(const std::string& jobId) const;

    /**
     * @brief Blocks until the job has no live run or the timeout expires.
     * @return True if the run is over.
     */
    bool waitForRun(const std::string& jobId, std::chrono::milliseconds timeout) const;

    /** @brief Cancels active runs, waits for them and stops the ticker. Idempotent. */
    void shutdown();

    /** @brief Parses a direction name. @throws ConfigError InvalidDirection. */
    static domain::sync::SyncDirection parseDirection(const std::string& value);

    /** @brief Splits a flag string on whitespace. */
    static std::vector<std::string> splitFlags(const std::string& flags);

private:
    struct ActiveRun {
        std::shared_ptr<RunControl> control;
        std::shared_ptr<ProgressAggregator> aggregator;
        std::chrono::steady_clock::time_point startedAt;
    };

    enum class PhaseOutcome {
        Finished,
        Failed,
        Cancelled
    };

    struct PhaseResult {
        PhaseOutcome outcome = PhaseOutcome::Finished;
        std::string reason;
        std::string message;
    };

    std::shared_ptr<domain::sync::JobRepository> m_repository;
    std::shared_ptr<domain::sync::MountMonitor> m_mountMonitor;
    std::shared_ptr<ItemExecutor> m_itemExecutor;
    std::unique_ptr<WorkerPool> m_workerPool;
    ControllerSettings m_settings;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_runsCv;
    std::map<std::string, domain::sync::Job> m_jobs;
    std::map<std::string, ActiveRun> m_runs;

    std::mutex m_listenersMutex;
    std::map<int, JobListener> m_listeners;
    int m_nextSubscription = 0;

    std::mutex m_errorLogMutex;

    std::mutex m_tickerMutex;
    std::condition_variable m_tickerCv;
    std::atomic<bool> m_stopping{false};

    AsyncTaskManager m_tasks;

    void loadAndReconcile();

    domain::sync::Job& requireJobLocked(const std::string& jobId);
    const domain::sync::Job& requireJobLocked(const std::string& jobId) const;
    void persistLocked(const domain::sync::Job& job, bool durable);
    void refreshProgressLocked(domain::sync::Job& job) const;

    /** @throws ConfigError on invalid parallelism or paths. */
    static void validateDefinition(const domain::sync::Job& job);

    /** @throws MountUnavailable unless the mount is usable. */
    void checkMount(const std::string& jobId) const;

    void runJob(const std::string& jobId, ActiveRun run);
    PhaseResult runPhase(const std::string& jobId, domain::sync::SyncPhase phase, const ActiveRun& run);
    void finishRun(const std::string& jobId, const ActiveRun& run, const PhaseResult& last);
    void handleEvent(const std::string& jobId,
                     domain::sync::SyncPhase phase,
                     const ActiveRun& run,
                     const domain::sync::WorkerEvent& event);
    void appendErrorLog(const std::string& jobId,
                        domain::sync::SyncPhase phase,
                        int workerIndex,
                        const std::string& item,
                        const std::string& message);

    void tickerLoop();

    void notifyState(const domain::sync::Job& job);
    void notifyProgress(const std::string& jobId, const domain::sync::ProgressSnapshot& snapshot);

    static std::string generateJobId();
};

} // namespace parasync::application::sync
