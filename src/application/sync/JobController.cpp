/**
 * @file JobController.cpp
 * @brief Implementation of JobController.
 */

#include "application/sync/JobController.hpp"

#include "application/sync/Batcher.hpp"
#include "infrastructure/sync/FileSystemItemScanner.hpp"
#include "infrastructure/sync/FilenameInspector.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include <unistd.h>
#include <uuid/uuid.h>

namespace parasync::application::sync {

using namespace parasync::domain::sync;
using infrastructure::sync::FileSystemItemScanner;
using infrastructure::sync::FilenameInspector;
using infrastructure::sync::ScanResult;
namespace fs = std::filesystem;

namespace {

ProgressCounters CountersFrom(const ProgressSnapshot& snapshot) {
    return ProgressCounters{snapshot.totalFiles, snapshot.filesDone, snapshot.totalBytes, snapshot.bytesDone};
}

std::string Timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::vector<SyncPhase> PhasesFor(SyncDirection direction) {
    if (direction == SyncDirection::Bidirectional) return {SyncPhase::Push, SyncPhase::Pull};
    if (direction == SyncDirection::Pull) return {SyncPhase::Pull};
    return {SyncPhase::Push};
}

} // namespace

JobController::JobController(std::shared_ptr<JobRepository> repository,
                             std::shared_ptr<ItemExecutor> itemExecutor,
                             std::shared_ptr<MountMonitor> mountMonitor,
                             ControllerSettings settings)
    : m_repository(std::move(repository))
    , m_mountMonitor(std::move(mountMonitor))
    , m_itemExecutor(std::move(itemExecutor))
    , m_workerPool(std::make_unique<WorkerPool>(m_itemExecutor))
    , m_settings(std::move(settings)) {
    if (m_settings.persistInterval.count() <= 0) {
        m_settings.persistInterval = std::chrono::milliseconds(2000);
    }
    if (!m_settings.logDir.empty()) {
        std::error_code ec;
        fs::create_directories(m_settings.logDir, ec);
        if (ec) {
            std::cerr << "[JobController] Cannot create log dir " << m_settings.logDir << ": " << ec.message() << std::endl;
        }
    }

    loadAndReconcile();

    m_tasks.SubmitTask(TaskType::ProgressTicker, "Progress persistence", [this]() { tickerLoop(); });
}

JobController::~JobController() {
    shutdown();
}

void JobController::loadAndReconcile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& job : m_repository->findAll()) {
        if (job.reconcileAfterRestart()) {
            std::cout << "[JobController] Job " << job.id << " was interrupted by a restart, marked Failed" << std::endl;
            persistLocked(job, true);
        }
        std::string id = job.id;
        m_jobs.emplace(id, std::move(job));
    }
    std::cout << "[JobController] Loaded " << m_jobs.size() << " job(s)" << std::endl;
}

SyncDirection JobController::parseDirection(const std::string& value) {
    auto direction = DirectionFromString(value);
    if (!direction) {
        throw ConfigError(ConfigError::Kind::InvalidDirection, "Invalid direction: '" + value + "'");
    }
    return *direction;
}

std::vector<std::string> JobController::splitFlags(const std::string& flags) {
    std::vector<std::string> parts;
    std::istringstream iss(flags);
    std::string part;
    while (iss >> part) parts.push_back(part);
    return parts;
}

std::string JobController::generateJobId() {
    uuid_t uuid;
    uuid_generate(uuid);
    char buffer[37];
    uuid_unparse_lower(uuid, buffer);
    return std::string(buffer);
}

void JobController::validateDefinition(const Job& job) {
    if (job.parallelism <= 0) {
        throw ConfigError(ConfigError::Kind::InvalidParallelism,
                          "Parallelism must be at least 1, got " + std::to_string(job.parallelism));
    }
    if (job.sourcePath.empty() || job.destPath.empty()) {
        throw ConfigError(ConfigError::Kind::InvalidPath, "Source and destination paths are required");
    }
    if (fs::path(job.sourcePath).lexically_normal() == fs::path(job.destPath).lexically_normal()) {
        throw ConfigError(ConfigError::Kind::InvalidPath, "Source and destination must differ");
    }
}

std::string JobController::createJob(const CreateJobRequest& request) {
    Job job;
    job.name = request.name.empty() ? fs::path(request.sourcePath).filename().string() : request.name;
    job.sourcePath = request.sourcePath;
    job.destPath = request.destPath;
    job.direction = request.direction;
    job.parallelism = request.parallelism.value_or(m_settings.defaultParallelism);
    job.excludePatterns = request.excludePatterns.value_or(m_settings.defaultExcludes);
    job.copyOptions = request.copyOptions.value_or(m_settings.copyOptions);
    job.phase = job.direction == SyncDirection::Pull ? SyncPhase::Pull : SyncPhase::Push;
    validateDefinition(job);

    job.id = generateJobId();
    job.createdAt = Clock::now();

    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        persistLocked(job, true);
        jobCopy = job;
        m_jobs.emplace(job.id, std::move(job));
    }
    std::cout << "[JobController] Created job " << jobCopy.id << " (" << jobCopy.name << "): "
              << jobCopy.sourcePath << " -> " << jobCopy.destPath << ", "
              << DirectionToString(jobCopy.direction) << ", " << jobCopy.parallelism << " workers" << std::endl;
    notifyState(jobCopy);
    return jobCopy.id;
}

Job JobController::updateJob(const std::string& jobId, const UpdateJobRequest& request) {
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        if (IsActive(job.state) || m_runs.count(jobId)) {
            throw InvalidTransition("Job " + jobId + " is " + StateToString(job.state) + " and cannot be edited");
        }

        Job updated = job;
        if (request.sourcePath) updated.sourcePath = *request.sourcePath;
        if (request.destPath) updated.destPath = *request.destPath;
        if (request.direction) updated.direction = *request.direction;
        if (request.parallelism) updated.parallelism = *request.parallelism;
        if (request.excludePatterns) updated.excludePatterns = *request.excludePatterns;
        if (request.copyOptions) updated.copyOptions = *request.copyOptions;
        if (request.name) {
            updated.name = request.name->empty() ? fs::path(updated.sourcePath).filename().string() : *request.name;
        }
        if (updated.state == JobState::Created) {
            updated.phase = updated.direction == SyncDirection::Pull ? SyncPhase::Pull : SyncPhase::Push;
        }
        validateDefinition(updated);

        persistLocked(updated, true);
        job = std::move(updated);
        jobCopy = job;
    }
    std::cout << "[JobController] Updated job " << jobId << " (" << jobCopy.name << "): "
              << jobCopy.sourcePath << " -> " << jobCopy.destPath << ", "
              << DirectionToString(jobCopy.direction) << ", " << jobCopy.parallelism << " workers" << std::endl;
    notifyState(jobCopy);
    return jobCopy;
}

DryRunReport JobController::dryRunJob(const std::string& jobId) {
    Job snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const Job& job = requireJobLocked(jobId);
        if (IsActive(job.state) || m_runs.count(jobId)) {
            throw InvalidTransition("Job " + jobId + " is " + StateToString(job.state) + "; dry run needs an idle job");
        }
        snapshot = job;
    }
    std::cout << "[JobController] Dry run of job " << jobId << std::endl;

    DryRunReport report;
    report.jobId = snapshot.id;
    report.jobName = snapshot.name;
    std::vector<std::string> excludes(snapshot.excludePatterns.begin(), snapshot.excludePatterns.end());

    for (SyncPhase phase : PhasesFor(snapshot.direction)) {
        checkMount(jobId);

        PhasePlan plan;
        plan.phase = phase;
        plan.sourcePath = phase == SyncPhase::Push ? snapshot.sourcePath : snapshot.destPath;
        plan.destPath = phase == SyncPhase::Push ? snapshot.destPath : snapshot.sourcePath;

        FileSystemItemScanner scanner(snapshot.excludePatterns);
        ScanResult scanned = scanner.scan(plan.sourcePath);
        plan.totalFiles = scanned.totalFiles;
        plan.totalBytes = scanned.totalBytes;

        if (!scanned.empty()) {
            plan.assignments = Batcher::assign(scanned.items, snapshot.parallelism);
            plan.filenameIssues = FilenameInspector(scanner).inspect(plan.sourcePath);

            CopyOptions options{plan.sourcePath, plan.destPath, splitFlags(snapshot.copyOptions), excludes};
            PreviewResult preview = m_itemExecutor->preview(options);
            for (const auto& change : preview.changes) {
                if (change.action == "delete") {
                    ++plan.filesToDelete;
                } else if (!change.isDirectory) {
                    ++plan.filesToTransfer;
                    plan.bytesToTransfer += change.sizeBytes;
                }
            }
            plan.changes = std::move(preview.changes);
            plan.toolErrors = std::move(preview.errors);
            plan.toolExitCode = preview.exitCode;
        }

        std::cout << "[JobController] Dry run " << jobId << " " << PhaseToString(phase) << ": "
                  << plan.totalFiles << " files, " << plan.filesToTransfer << " to transfer ("
                  << plan.bytesToTransfer << " bytes), " << plan.filesToDelete << " to delete" << std::endl;
        if (plan.toolExitCode != 0) {
            std::cerr << "[JobController] Dry run " << jobId << ": copy tool exited with "
                      << plan.toolExitCode << std::endl;
        }
        report.phases.push_back(std::move(plan));
    }
    return report;
}

void JobController::startJob(const std::string& jobId) {
    ActiveRun run{std::make_shared<RunControl>(), std::make_shared<ProgressAggregator>(),
                  std::chrono::steady_clock::now()};
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Checked under the lock so shutdown() sees every run it has to wait for.
        if (m_stopping) {
            throw InvalidTransition("Controller is shutting down");
        }
        Job& job = requireJobLocked(jobId);
        if (m_runs.count(jobId)) {
            throw InvalidTransition("Job " + jobId + " is still finishing its previous run");
        }
        job.transitionTo(JobState::Scanning);
        m_runs.emplace(jobId, run);
        persistLocked(job, true);
        jobCopy = job;
    }
    std::cout << "[JobController] Starting job " << jobId << std::endl;
    notifyState(jobCopy);

    try {
        m_tasks.SubmitTask(TaskType::JobRun, "Job " + jobId, [this, jobId, run]() { runJob(jobId, run); });
    } catch (const std::exception& e) {
        std::cerr << "[JobController] Cannot start run task for job " << jobId << ": " << e.what() << std::endl;
        Job failedCopy;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Job& job = requireJobLocked(jobId);
            if (IsActive(job.state)) {
                job.transitionTo(JobState::Failed, kSetupError);
                job.errors.push_back(JobError{-1, "", e.what(), Clock::now(), job.phase});
                persistLocked(job, true);
            }
            failedCopy = job;
            m_runs.erase(jobId);
        }
        m_runsCv.notify_all();
        notifyState(failedCopy);
        throw;
    }
}

void JobController::pauseJob(const std::string& jobId) {
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        job.transitionTo(JobState::Paused);
        m_runs.at(jobId).control->pause();
        refreshProgressLocked(job);
        persistLocked(job, true);
        jobCopy = job;
    }
    std::cout << "[JobController] Paused job " << jobId << std::endl;
    notifyState(jobCopy);
}

void JobController::resumeJob(const std::string& jobId) {
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        job.transitionTo(JobState::Running);
        m_runs.at(jobId).control->resume();
        refreshProgressLocked(job);
        persistLocked(job, true);
        jobCopy = job;
    }
    std::cout << "[JobController] Resumed job " << jobId << std::endl;
    notifyState(jobCopy);
}

void JobController::cancelJob(const std::string& jobId) {
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        job.transitionTo(JobState::Cancelled);
        auto it = m_runs.find(jobId);
        if (it != m_runs.end()) {
            it->second.control->cancel();
        }
        refreshProgressLocked(job);
        persistLocked(job, true);
        jobCopy = job;
    }
    std::cout << "[JobController] Cancelled job " << jobId << "; stopping in-flight copies" << std::endl;
    notifyState(jobCopy);
}

void JobController::deleteJob(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        if (IsActive(job.state) || m_runs.count(jobId)) {
            throw InvalidTransition("Job " + jobId + " is " + StateToString(job.state) + " and cannot be deleted");
        }
        m_jobs.erase(jobId);
        m_repository->remove(jobId);
    }
    std::cout << "[JobController] Deleted job " << jobId << std::endl;
}

Job JobController::getJobStatus(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Job job = requireJobLocked(jobId);
    refreshProgressLocked(job);
    return job;
}

ProgressSnapshot JobController::getProgress(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Job& job = requireJobLocked(jobId);
    auto it = m_runs.find(jobId);
    if (it != m_runs.end()) {
        return it->second.aggregator->snapshot();
    }

    ProgressSnapshot snapshot;
    snapshot.totalFiles = job.progress.totalFiles;
    snapshot.filesDone = job.progress.filesDone;
    snapshot.totalBytes = job.progress.totalBytes;
    snapshot.bytesDone = job.progress.bytesDone;
    return snapshot;
}

std::vector<Job> JobController::listJobs() const {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        jobs.reserve(m_jobs.size());
        for (const auto& [id, job] : m_jobs) {
            jobs.push_back(job);
            refreshProgressLocked(jobs.back());
        }
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return jobs;
}

int JobController::subscribe(JobListener listener) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    int id = m_nextSubscription++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void JobController::unsubscribe(int subscriptionId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(subscriptionId);
}

bool JobController::hasLiveRun(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_runs.count(jobId) > 0;
}

bool JobController::waitForRun(const std::string& jobId, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_runsCv.wait_for(lock, timeout, [this, &jobId] { return m_runs.count(jobId) == 0; });
}

void JobController::shutdown() {
    if (m_stopping.exchange(true)) return;

    std::vector<Job> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, run] : m_runs) {
            run.control->cancel();
            Job& job = m_jobs.at(id);
            if (IsActive(job.state)) {
                job.transitionTo(JobState::Cancelled);
                refreshProgressLocked(job);
                persistLocked(job, true);
                cancelled.push_back(job);
            }
        }
    }
    for (const auto& job : cancelled) {
        std::cout << "[JobController] Shutdown: cancelled job " << job.id << std::endl;
        notifyState(job);
    }

    // Run tasks erase their entry as their last step; a start that raced this
    // call may still be submitting, so wait on the registry, not just the threads.
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_runsCv.wait(lock, [this] { return m_runs.empty(); });
    }

    {
        std::lock_guard<std::mutex> lock(m_tickerMutex);
    }
    m_tickerCv.notify_all();
    m_tasks.WaitAll();
    std::cout << "[JobController] Stopped" << std::endl;
}

Job& JobController::requireJobLocked(const std::string& jobId) {
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) throw JobNotFound(jobId);
    return it->second;
}

const Job& JobController::requireJobLocked(const std::string& jobId) const {
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) throw JobNotFound(jobId);
    return it->second;
}

void JobController::persistLocked(const Job& job, bool durable) {
    m_repository->save(job, durable);
}

void JobController::refreshProgressLocked(Job& job) const {
    auto it = m_runs.find(job.id);
    if (it != m_runs.end()) {
        job.progress = CountersFrom(it->second.aggregator->snapshot());
    }
}

void JobController::runJob(const std::string& jobId, ActiveRun run) {
    SyncDirection direction;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        direction = requireJobLocked(jobId).direction;
    }

    PhaseResult last;
    for (SyncPhase phase : PhasesFor(direction)) {
        if (run.control->isCancelled()) {
            last = PhaseResult{PhaseOutcome::Cancelled, "", ""};
            break;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Job& job = requireJobLocked(jobId);
            if (job.phase != phase) {
                job.phase = phase;
                persistLocked(job, false);
            }
        }

        try {
            last = runPhase(jobId, phase, run);
        } catch (const std::exception& e) {
            std::cerr << "[JobController] Job " << jobId << " " << PhaseToString(phase)
                      << " phase setup failed: " << e.what() << std::endl;
            last = PhaseResult{PhaseOutcome::Failed, kSetupError, e.what()};
        }

        // A failed or cancelled phase ends the run; the pull phase is skipped.
        if (last.outcome != PhaseOutcome::Finished) break;
    }

    finishRun(jobId, run, last);
}

JobController::PhaseResult JobController::runPhase(const std::string& jobId, SyncPhase phase, const ActiveRun& run) {
    Job snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = requireJobLocked(jobId);
    }
    const std::string& src = phase == SyncPhase::Push ? snapshot.sourcePath : snapshot.destPath;
    const std::string& dst = phase == SyncPhase::Push ? snapshot.destPath : snapshot.sourcePath;
    std::cout << "[JobController] Job " << jobId << " " << PhaseToString(phase) << " phase: "
              << src << " -> " << dst << std::endl;

    try {
        checkMount(jobId);
    } catch (const MountUnavailable& e) {
        return PhaseResult{PhaseOutcome::Failed, kMountUnavailable, e.what()};
    }

    FileSystemItemScanner scanner(snapshot.excludePatterns);
    ScanResult scanned;
    try {
        scanned = scanner.scan(src);
    } catch (const ScanError& e) {
        std::cerr << "[JobController] Job " << jobId << " scan failed: " << e.what() << std::endl;
        return PhaseResult{PhaseOutcome::Failed, ScanErrorKindToString(e.kind()), e.what()};
    }
    if (scanned.skippedEntries > 0) {
        std::cerr << "[JobController] Job " << jobId << ": " << scanned.skippedEntries
                  << " unreadable entries skipped while sizing" << std::endl;
    }

    if (run.control->isCancelled()) {
        return PhaseResult{PhaseOutcome::Cancelled, "", ""};
    }
    if (scanned.empty()) {
        std::cout << "[JobController] Job " << jobId << ": nothing to copy in " << src << std::endl;
        return PhaseResult{};
    }

    auto issues = FilenameInspector(scanner).inspect(src);
    if (!issues.empty()) {
        std::cerr << "[JobController] Job " << jobId << ": " << issues.size()
                  << " file name(s) may not be portable to the destination" << std::endl;
    }

    std::error_code ec;
    fs::create_directories(dst, ec);
    if (ec || ::access(dst.c_str(), W_OK) != 0) {
        std::string message = "Destination " + dst + " is not writable";
        if (ec) message += ": " + ec.message();
        std::cerr << "[JobController] Job " << jobId << ": " << message << std::endl;
        return PhaseResult{PhaseOutcome::Failed, kDestinationUnwritable, message};
    }

    auto assignments = Batcher::assign(scanned.items, snapshot.parallelism);

    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        if (job.state == JobState::Cancelled || run.control->isCancelled()) {
            return PhaseResult{PhaseOutcome::Cancelled, "", ""};
        }
        job.workerAssignments[phase] = assignments;
        for (auto& issue : issues) {
            if (job.filenameIssues.size() >= FilenameInspector::kMaxIssues) break;
            job.filenameIssues.push_back(std::move(issue));
        }
        run.aggregator->beginPhase(assignments);
        if (job.state == JobState::Scanning) {
            job.transitionTo(JobState::Running);
        }
        refreshProgressLocked(job);
        persistLocked(job, true);
        jobCopy = job;
    }
    std::cout << "[JobController] Job " << jobId << ": " << scanned.items.size() << " items, "
              << scanned.totalFiles << " files, " << scanned.totalBytes << " bytes across "
              << assignments.size() << " workers" << std::endl;
    notifyState(jobCopy);

    std::vector<std::string> excludes(snapshot.excludePatterns.begin(), snapshot.excludePatterns.end());
    CopyOptions options{src, dst, splitFlags(snapshot.copyOptions), excludes};

    m_workerPool->run(jobId, assignments, options, *run.control,
                      [this, &jobId, phase, &run](const WorkerEvent& event) { handleEvent(jobId, phase, run, event); });

    if (run.control->isCancelled()) {
        return PhaseResult{PhaseOutcome::Cancelled, "", ""};
    }
    return PhaseResult{};
}

void JobController::checkMount(const std::string& jobId) const {
    if (!m_mountMonitor) return;
    MountStatus status = m_mountMonitor->status();
    if (status != MountStatus::Available) {
        std::string message = "Mount " + m_mountMonitor->mountPoint() + " is " + MountStatusToString(status);
        std::cerr << "[JobController] Job " << jobId << ": " << message << std::endl;
        throw MountUnavailable(message);
    }
}

void JobController::handleEvent(const std::string& jobId, SyncPhase phase, const ActiveRun& run, const WorkerEvent& event) {
    run.aggregator->apply(event);

    if (const auto* failed = std::get_if<ItemFailed>(&event)) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_jobs.find(jobId);
            if (it != m_jobs.end()) {
                it->second.recordItemError(phase, failed->workerIndex, failed->item.relativePath, failed->message);
            }
        }
        appendErrorLog(jobId, phase, failed->workerIndex, failed->item.relativePath, failed->message);
    }
}

void JobController::appendErrorLog(const std::string& jobId, SyncPhase phase, int workerIndex,
                                   const std::string& item, const std::string& message) {
    if (m_settings.logDir.empty()) return;

    std::lock_guard<std::mutex> lock(m_errorLogMutex);
    std::ofstream log(fs::path(m_settings.logDir) / "errors.log", std::ios::app);
    if (!log) {
        std::cerr << "[JobController] Cannot append to errors.log in " << m_settings.logDir << std::endl;
        return;
    }
    log << Timestamp() << " job=" << jobId << " phase=" << PhaseToString(phase) << " worker=" << workerIndex
        << " item=" << item << " error=" << message << "\n";
}

void JobController::finishRun(const std::string& jobId, const ActiveRun& run, const PhaseResult& last) {
    ProgressSnapshot finalProgress = run.aggregator->snapshot();
    Job jobCopy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Job& job = requireJobLocked(jobId);
        job.progress = CountersFrom(finalProgress);

        if (IsActive(job.state)) {
            if (last.outcome == PhaseOutcome::Failed) {
                job.transitionTo(JobState::Failed, last.reason);
                job.errors.push_back(JobError{-1, "", last.message, Clock::now(), job.phase});
            } else if (last.outcome == PhaseOutcome::Cancelled) {
                job.transitionTo(JobState::Cancelled);
            } else if (job.itemErrorCount() > 0) {
                job.transitionTo(JobState::CompletedWithErrors);
            } else {
                job.transitionTo(JobState::Completed);
            }
        }

        RunStats stats;
        stats.durationSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - run.startedAt).count();
        stats.filesSynced = finalProgress.filesDone;
        stats.bytesSynced = finalProgress.bytesDone;
        stats.errorCount = job.itemErrorCount();
        job.lastRunStats = stats;
        job.runCount++;
        job.totalFilesSynced += stats.filesSynced;
        job.totalBytesSynced += stats.bytesSynced;
        job.totalRunSeconds += stats.durationSeconds;

        persistLocked(job, true);
        jobCopy = job;
    }

    std::cout << "[JobController] Job " << jobId << " finished: " << StateToString(jobCopy.state);
    if (!jobCopy.failureReason.empty()) std::cout << " (" << jobCopy.failureReason << ")";
    std::cout << ", " << finalProgress.filesDone << "/" << finalProgress.totalFiles << " files, "
              << jobCopy.itemErrorCount() << " item error(s)" << std::endl;

    notifyProgress(jobId, finalProgress);
    notifyState(jobCopy);

    // Released only after listeners saw the final state, so waitForRun() observers never miss it.
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_runs.erase(jobId);
    }
    m_runsCv.notify_all();
}

void JobController::tickerLoop() {
    while (!m_stopping) {
        {
            std::unique_lock<std::mutex> lock(m_tickerMutex);
            m_tickerCv.wait_for(lock, m_settings.persistInterval, [this] { return m_stopping.load(); });
        }
        if (m_stopping) break;

        std::vector<std::pair<std::string, ProgressSnapshot>> updates;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& [id, run] : m_runs) {
                auto it = m_jobs.find(id);
                if (it == m_jobs.end()) continue;
                Job& job = it->second;
                if (job.state != JobState::Running && job.state != JobState::Paused) continue;

                ProgressSnapshot snapshot = run.aggregator->snapshot();
                job.progress = CountersFrom(snapshot);
                persistLocked(job, false);
                updates.emplace_back(id, std::move(snapshot));
            }
        }
        for (const auto& [id, snapshot] : updates) {
            notifyProgress(id, snapshot);
        }
    }
}

void JobController::notifyState(const Job& job) {
    std::vector<JobListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& [id, listener] : m_listeners) listeners.push_back(listener);
    }
    for (const auto& listener : listeners) {
        if (listener.onStateChanged) listener.onStateChanged(job);
    }
}

void JobController::notifyProgress(const std::string& jobId, const ProgressSnapshot& snapshot) {
    std::vector<JobListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& [id, listener] : m_listeners) listeners.push_back(listener);
    }
    for (const auto& listener : listeners) {
        if (listener.onProgress) listener.onProgress(jobId, snapshot);
    }
}

} // namespace parasync::application::sync
