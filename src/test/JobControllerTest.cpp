#include <algorithm>
#include <atomic>
#include <cassert>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "application/sync/JobController.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/sync/JobRepositoryFs.hpp"
#include "infrastructure/sync/RsyncCopyExecutor.hpp"
#include "test/FakeCopyExecutor.hpp"

namespace fs = std::filesystem;
using namespace parasync::domain::sync;
using namespace parasync::application::sync;
using parasync::infrastructure::PersistenceService;
using parasync::infrastructure::sync::JobRepositoryFs;
using parasync::infrastructure::sync::RsyncCopyExecutor;

namespace {

constexpr auto kWait = std::chrono::seconds(20);

void WriteFile(const fs::path& path, std::size_t bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(bytes, 'x');
}

/**
 * Controller wired to a throwaway state directory, the in-process copy fake
 * (or a real tool set before boot()) and a fake mount monitor.
 */
struct Harness {
    fs::path root;
    std::shared_ptr<PersistenceService> persistence;
    std::shared_ptr<JobRepositoryFs> repository;
    std::shared_ptr<FakeCopyExecutor> copy;
    std::shared_ptr<CopyExecutor> tool; ///< Replaces the fake when set.
    std::shared_ptr<FakeMountMonitor> mount;
    std::unique_ptr<JobController> controller;

    std::mutex statesMutex;
    std::map<std::string, std::vector<JobState>> states;

    explicit Harness(const std::string& name, bool start = true) {
        root = fs::temp_directory_path() / ("parasync_ctrl_" + name + "_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root / "state" / "jobs");
        persistence = std::make_shared<PersistenceService>();
        repository = std::make_shared<JobRepositoryFs>((root / "state").string(), persistence);
        copy = std::make_shared<FakeCopyExecutor>();
        mount = std::make_shared<FakeMountMonitor>();
        if (start) boot();
    }

    void boot() {
        ControllerSettings settings;
        settings.defaultParallelism = 2;
        settings.copyOptions = "-a";
        settings.logDir = (root / "log").string();
        settings.persistInterval = std::chrono::milliseconds(50);
        controller = std::make_unique<JobController>(
            repository,
            std::make_shared<ItemExecutor>(tool ? tool : std::shared_ptr<CopyExecutor>(copy), std::chrono::milliseconds(0)),
            mount, settings);
        controller->subscribe(JobListener{
            [this](const Job& job) {
                std::lock_guard<std::mutex> lock(statesMutex);
                states[job.id].push_back(job.state);
            },
            nullptr});
    }

    ~Harness() {
        if (controller) controller->shutdown();
        persistence->stop();
        fs::remove_all(root);
    }

    std::vector<JobState> statesOf(const std::string& id) {
        std::lock_guard<std::mutex> lock(statesMutex);
        return states[id];
    }

    std::string create(const fs::path& src, const fs::path& dst,
                       SyncDirection direction = SyncDirection::Push, int parallelism = 2) {
        CreateJobRequest request;
        request.name = "test";
        request.sourcePath = src.string();
        request.destPath = dst.string();
        request.direction = direction;
        request.parallelism = parallelism;
        return controller->createJob(request);
    }

    Job runToEnd(const std::string& id) {
        controller->startJob(id);
        bool finished = controller->waitForRun(id, kWait);
        assert(finished && "run did not finish in time");
        return controller->getJobStatus(id);
    }
};

bool Contains(const std::vector<JobState>& states, JobState s) {
    return std::find(states.begin(), states.end(), s) != states.end();
}

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void TestEmptySourceCompletesWithoutRunning() {
    Harness h("empty");
    fs::create_directories(h.root / "src");
    std::string id = h.create(h.root / "src", h.root / "dst");

    Job job = h.runToEnd(id);
    assert(job.state == JobState::Completed);
    assert(job.progress.totalFiles == 0 && job.progress.totalBytes == 0);
    assert(job.errors.empty());
    assert(h.copy->started().empty());

    auto states = h.statesOf(id);
    assert(Contains(states, JobState::Scanning));
    assert(!Contains(states, JobState::Running) && "an empty scan never reaches Running");
    assert(states.back() == JobState::Completed);
    std::cout << "[PASS] Empty source goes straight to Completed." << std::endl;
}

void TestMissingSourceFails() {
    Harness h("missing");
    std::string id = h.create(h.root / "nope", h.root / "dst");
    Job job = h.runToEnd(id);
    assert(job.state == JobState::Failed);
    assert(job.failureReason == "NotFound");
    assert(job.errors.size() == 1 && job.errors[0].workerIndex == -1);
    assert(job.errors[0].phase == SyncPhase::Push);
    std::cout << "[PASS] Missing source fails the job." << std::endl;
}

void TestMountUnavailableFails() {
    Harness h("mount");
    WriteFile(h.root / "src" / "a", 1);
    h.mount->current = MountStatus::Disconnected;
    std::string id = h.create(h.root / "src", h.root / "dst");
    Job job = h.runToEnd(id);
    assert(job.state == JobState::Failed);
    assert(job.failureReason == kMountUnavailable);
    assert(h.copy->started().empty());

    // Retryable by the operator once the mount is back.
    h.mount->current = MountStatus::Available;
    job = h.runToEnd(id);
    assert(job.state == JobState::Completed);
    assert(job.failureReason.empty());
    assert(job.runCount == 2);
    std::cout << "[PASS] Unavailable mount fails fast and can be retried." << std::endl;
}

void TestItemFailureCompletesWithErrors() {
    Harness h("itemfail");
    WriteFile(h.root / "src" / "alpha", 300);
    WriteFile(h.root / "src" / "beta", 200);
    WriteFile(h.root / "src" / "gamma" / "g1", 100);
    WriteFile(h.root / "src" / "gamma" / "g2", 100);
    h.copy->failing = {"beta"};

    std::string id = h.create(h.root / "src", h.root / "dst");
    Job job = h.runToEnd(id);

    assert(job.state == JobState::CompletedWithErrors);
    assert(job.errors.size() == 1);
    assert(job.errors[0].item == "beta");
    assert(job.errors[0].workerIndex >= 0);
    assert(job.errors[0].message.find("Permission denied") != std::string::npos);
    assert(job.progress.totalFiles == 4);
    assert(job.progress.filesDone == 3);
    assert(job.progress.bytesDone == 500);
    assert(job.errors[0].phase == SyncPhase::Push);
    assert(job.workerAssignments.size() == 1);
    assert(job.workerAssignments.at(SyncPhase::Push).size() == 2);
    assert(job.lastRunStats && job.lastRunStats->errorCount == 1);
    assert(fs::is_directory(h.root / "dst"));

    std::string contents = ReadAll(h.root / "log" / "errors.log");
    assert(contents.find("phase=push") != std::string::npos);
    assert(contents.find("item=beta") != std::string::npos);
    assert(contents.find("job=" + id) != std::string::npos);

    // The durable record agrees with memory.
    auto stored = h.repository->findById(id);
    assert(stored && stored->state == JobState::CompletedWithErrors);
    assert(stored->errors.size() == 1);
    std::cout << "[PASS] Item failure ends CompletedWithErrors." << std::endl;
}

void TestCancelStopsInFlightCopies() {
    Harness h("cancel_stop");
    for (int i = 0; i < 6; ++i) WriteFile(h.root / "src" / ("f" + std::to_string(i)), 10 + i);
    h.copy->holdUntilReleased = true;

    std::string id = h.create(h.root / "src", h.root / "dst");
    h.controller->startJob(id);
    assert(h.copy->waitForStarted(2));

    // The held copies are never released; only the cancel ends them.
    h.controller->cancelJob(id);
    assert(h.controller->waitForRun(id, std::chrono::seconds(5)));

    Job job = h.controller->getJobStatus(id);
    assert(job.state == JobState::Cancelled);
    assert(h.copy->started().size() == 2);
    assert(job.errors.size() == 2 && "each interrupted copy is reported, untouched items are not");
    for (const auto& error : job.errors) {
        assert(error.workerIndex >= 0);
        assert(error.phase == SyncPhase::Push);
        assert(error.message.find("stopped by cancel") != std::string::npos);
    }
    assert(job.progress.filesDone == 0);

    h.copy->release();
    job = h.runToEnd(id);
    assert(job.state == JobState::Completed);
    assert(job.errors.empty());
    std::cout << "[PASS] Cancel stops in-flight copies." << std::endl;
}

void TestCancelTerminatesHungTool() {
    Harness h("hung", false);
    for (int i = 0; i < 4; ++i) WriteFile(h.root / "src" / ("f" + std::to_string(i)), 10);
    fs::path marker = h.root / "started.txt";
    fs::path script = h.root / "hung-rsync.sh";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "trap '' TERM\n"
            << "echo started >> '" << marker.string() << "'\n"
            << "sleep 20\n";
    }
    fs::permissions(script, fs::perms::owner_all);
    h.tool = std::make_shared<RsyncCopyExecutor>(script.string(), std::chrono::milliseconds(300));
    h.boot();

    std::string id = h.create(h.root / "src", h.root / "dst");
    h.controller->startJob(id);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    auto startedCount = [&]() {
        std::string text = ReadAll(marker);
        return std::count(text.begin(), text.end(), '\n');
    };
    while (startedCount() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(startedCount() == 2);

    auto begin = std::chrono::steady_clock::now();
    h.controller->cancelJob(id);
    assert(h.controller->waitForRun(id, std::chrono::seconds(3)) && "a tool ignoring SIGTERM is killed");
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(3));

    Job job = h.controller->getJobStatus(id);
    assert(job.state == JobState::Cancelled);
    assert(job.errors.size() == 2);
    assert(::waitpid(-1, nullptr, WNOHANG) == -1 && errno == ECHILD);

    // The run is over, so the job can start again right away.
    h.controller->startJob(id);
    h.controller->cancelJob(id);
    assert(h.controller->waitForRun(id, std::chrono::seconds(3)));
    assert(h.controller->getJobStatus(id).state == JobState::Cancelled);
    std::cout << "[PASS] Cancel terminates a hung copy tool." << std::endl;
}

void TestCancelMidRun() {
    Harness h("cancel");
    for (int i = 0; i < 6; ++i) WriteFile(h.root / "src" / ("f" + std::to_string(i)), 10 + i);
    h.copy->holdUntilReleased = true;
    h.copy->ignoreStop = true;

    std::string id = h.create(h.root / "src", h.root / "dst");
    h.controller->startJob(id);
    assert(h.copy->waitForStarted(2));
    assert(h.controller->getJobStatus(id).state == JobState::Running);

    h.controller->cancelJob(id);
    assert(h.controller->getJobStatus(id).state == JobState::Cancelled);

    bool threw = false;
    try {
        h.controller->startJob(id);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    assert(threw && "a run whose copies are still ending cannot be restarted");

    h.copy->release();
    assert(h.controller->waitForRun(id, kWait));

    Job job = h.controller->getJobStatus(id);
    assert(job.state == JobState::Cancelled);
    assert(h.copy->started().size() == 2);
    assert(h.copy->finished().size() == 2);
    assert(job.errors.empty() && "items that never started produce no errors");
    assert(job.progress.filesDone == 2);
    std::cout << "[PASS] Cancel mid-run dispatches nothing new." << std::endl;
}

void TestPauseResume() {
    Harness h("pause");
    for (int i = 0; i < 4; ++i) WriteFile(h.root / "src" / ("f" + std::to_string(i)), 10);
    h.copy->holdUntilReleased = true;

    std::string id = h.create(h.root / "src", h.root / "dst", SyncDirection::Push, 1);

    bool threw = false;
    try {
        h.controller->pauseJob(id);
    } catch (const InvalidTransition&) {
        threw = true;
    }
    assert(threw && "a Created job cannot be paused");

    h.controller->startJob(id);
    assert(h.copy->waitForStarted(1));
    h.controller->pauseJob(id);
    assert(h.controller->getJobStatus(id).state == JobState::Paused);

    // The in-flight item finishes; nothing new is dispatched while paused.
    h.copy->release();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    assert(h.copy->started().size() == 1);
    assert(h.controller->hasLiveRun(id));

    h.controller->resumeJob(id);
    assert(h.controller->waitForRun(id, kWait));
    Job job = h.controller->getJobStatus(id);
    assert(job.state == JobState::Completed);
    assert(h.copy->started().size() == 4);

    auto states = h.statesOf(id);
    assert(Contains(states, JobState::Paused));
    std::cout << "[PASS] Pause and resume." << std::endl;
}

void TestRestartReconciliation() {
    Harness h("restart", false);

    Job running;
    running.id = "running-job";
    running.sourcePath = "/a";
    running.destPath = "/b";
    running.state = JobState::Running;
    running.createdAt = Clock::now();
    running.startedAt = Clock::now();

    Job done = running;
    done.id = "done-job";
    done.state = JobState::Completed;
    done.finishedAt = Clock::now();

    Job fresh = running;
    fresh.id = "fresh-job";
    fresh.state = JobState::Created;
    fresh.startedAt.reset();

    h.repository->save(running, true);
    h.repository->save(done, true);
    h.repository->save(fresh, true);

    h.boot();

    Job reconciled = h.controller->getJobStatus("running-job");
    assert(reconciled.state == JobState::Failed);
    assert(reconciled.failureReason == kIncompleteOnRestart);
    assert(h.controller->getJobStatus("done-job").state == JobState::Completed);
    assert(h.controller->getJobStatus("fresh-job").state == JobState::Created);
    assert(h.controller->listJobs().size() == 3);

    auto stored = h.repository->findById("running-job");
    assert(stored && stored->state == JobState::Failed);
    assert(stored->failureReason == kIncompleteOnRestart);
    std::cout << "[PASS] Restart reconciliation." << std::endl;
}

void TestBidirectional() {
    {
        Harness h("bidi_errors");
        WriteFile(h.root / "local" / "shared_bad", 10);
        WriteFile(h.root / "local" / "push_ok", 10);
        WriteFile(h.root / "remote" / "shared_bad", 10);
        WriteFile(h.root / "remote" / "pull_ok", 10);
        h.copy->failing = {"shared_bad"};

        std::string id = h.create(h.root / "local", h.root / "remote", SyncDirection::Bidirectional);
        Job job = h.runToEnd(id);

        assert(job.state == JobState::CompletedWithErrors);
        assert(job.phase == SyncPhase::Pull);
        bool pulled = false;
        for (const auto& src : h.copy->started()) {
            if (src.find((h.root / "remote").string()) == 0) pulled = true;
        }
        assert(pulled && "pull phase runs after a push with item errors");
        // The same item failing in both directions stays distinguishable.
        assert(job.errors.size() == 2);
        assert(job.errors[0].item == "shared_bad" && job.errors[0].phase == SyncPhase::Push);
        assert(job.errors[1].item == "shared_bad" && job.errors[1].phase == SyncPhase::Pull);
        assert(job.workerAssignments.count(SyncPhase::Push) == 1);
        assert(job.workerAssignments.count(SyncPhase::Pull) == 1);

        auto stored = h.repository->findById(id);
        assert(stored && stored->errors.size() == 2 && stored->errors[1].phase == SyncPhase::Pull);
        assert(stored->workerAssignments.size() == 2);

        std::string log = ReadAll(h.root / "log" / "errors.log");
        assert(log.find("phase=push") != std::string::npos);
        assert(log.find("phase=pull") != std::string::npos);
    }
    {
        Harness h("bidi_failed");
        WriteFile(h.root / "remote" / "pull_ok", 10);

        std::string id = h.create(h.root / "missing-local", h.root / "remote", SyncDirection::Bidirectional);
        Job job = h.runToEnd(id);

        assert(job.state == JobState::Failed);
        assert(job.failureReason == "NotFound");
        assert(job.phase == SyncPhase::Push);
        assert(h.copy->started().empty() && "pull phase is skipped after a failed push");
    }
    std::cout << "[PASS] Bidirectional phase gating." << std::endl;
}

void TestValidationAndDelete() {
    Harness h("validate");
    fs::create_directories(h.root / "src");

    bool badParallelism = false;
    try {
        h.create(h.root / "src", h.root / "dst", SyncDirection::Push, 0);
    } catch (const ConfigError& e) {
        badParallelism = e.kind() == ConfigError::Kind::InvalidParallelism;
    }
    assert(badParallelism);

    bool badPath = false;
    try {
        h.create("", h.root / "dst");
    } catch (const ConfigError& e) {
        badPath = e.kind() == ConfigError::Kind::InvalidPath;
    }
    assert(badPath);

    bool badDirection = false;
    try {
        JobController::parseDirection("sideways");
    } catch (const ConfigError& e) {
        badDirection = e.kind() == ConfigError::Kind::InvalidDirection;
    }
    assert(badDirection);
    assert(JobController::parseDirection("filespace-to-local") == SyncDirection::Pull);

    std::string first = h.create(h.root / "src", h.root / "dst");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::string second = h.create(h.root / "src", h.root / "dst2");
    auto jobs = h.controller->listJobs();
    assert(jobs.size() == 2);
    assert(jobs[0].id == first && jobs[1].id == second);
    assert(jobs[0].copyOptions == "-a");

    h.runToEnd(first);
    h.controller->deleteJob(first);
    assert(h.controller->listJobs().size() == 1);
    assert(!h.repository->findById(first));

    bool notFound = false;
    try {
        h.controller->getJobStatus(first);
    } catch (const JobNotFound&) {
        notFound = true;
    }
    assert(notFound);
    std::cout << "[PASS] Validation, listing and delete." << std::endl;
}

void TestUpdateJob() {
    Harness h("update");
    WriteFile(h.root / "src" / "a", 10);
    std::string id = h.create(h.root / "src", h.root / "dst");

    UpdateJobRequest request;
    request.name = "renamed";
    request.parallelism = 3;
    request.direction = SyncDirection::Pull;
    request.excludePatterns = std::set<std::string>{"*.bak"};
    Job updated = h.controller->updateJob(id, request);
    assert(updated.name == "renamed");
    assert(updated.parallelism == 3);
    assert(updated.direction == SyncDirection::Pull);
    assert(updated.phase == SyncPhase::Pull);
    assert(updated.excludePatterns.count("*.bak") == 1);
    assert(updated.sourcePath == (h.root / "src").string() && "unset fields are kept");

    auto stored = h.repository->findById(id);
    assert(stored && stored->name == "renamed" && stored->parallelism == 3);

    UpdateJobRequest zero;
    zero.parallelism = 0;
    assert(Throws<ConfigError>([&] { h.controller->updateJob(id, zero); }));
    UpdateJobRequest same;
    same.destPath = (h.root / "src").string();
    assert(Throws<ConfigError>([&] { h.controller->updateJob(id, same); }));
    assert(h.controller->getJobStatus(id).parallelism == 3 && "a rejected update changes nothing");

    UpdateJobRequest unnamed;
    unnamed.name = "";
    unnamed.direction = SyncDirection::Push;
    assert(h.controller->updateJob(id, unnamed).name == "src");

    h.copy->holdUntilReleased = true;
    h.controller->startJob(id);
    assert(h.copy->waitForStarted(1));
    assert(Throws<InvalidTransition>([&] { h.controller->updateJob(id, request); }));
    h.copy->release();
    assert(h.controller->waitForRun(id, kWait));
    assert(h.controller->updateJob(id, request).name == "renamed");

    assert(Throws<JobNotFound>([&] { h.controller->updateJob("no-such-job", request); }));
    std::cout << "[PASS] Update of idle jobs." << std::endl;
}

void TestDryRun() {
    Harness h("dryrun");
    WriteFile(h.root / "src" / "alpha", 300);
    WriteFile(h.root / "src" / "beta", 200);
    WriteFile(h.root / "src" / "gamma" / "g1", 100);
    h.copy->dryRunOutput = {
        "sending incremental file list",
        ">f+++++++++ alpha",
        "cd+++++++++ gamma/",
        ">f+++++++++ gamma/g1",
        ">f.st...... beta",
        "*deleting   old.txt",
        "sent 1,024 bytes  received 35 bytes  2,118.00 bytes/sec",
    };

    std::string id = h.create(h.root / "src", h.root / "dst");
    DryRunReport report = h.controller->dryRunJob(id);
    assert(report.jobId == id);
    assert(report.phases.size() == 1);
    const PhasePlan& plan = report.phases[0];
    assert(plan.phase == SyncPhase::Push);
    assert(plan.totalFiles == 3 && plan.totalBytes == 600);
    assert(plan.assignments.size() == 2);
    assert(plan.changes.size() == 5);
    assert(plan.filesToTransfer == 3);
    assert(plan.bytesToTransfer == 600);
    assert(plan.filesToDelete == 1);
    assert(plan.toolErrors.empty());

    // Nothing was copied or created, and the job is untouched.
    assert(h.copy->started().empty());
    assert(!fs::exists(h.root / "dst"));
    assert(h.copy->previews().size() == 1);
    assert(h.copy->previews()[0].sourcePath == (h.root / "src").string() + "/");
    assert(h.controller->getJobStatus(id).state == JobState::Created);

    h.mount->current = MountStatus::Disconnected;
    assert(Throws<MountUnavailable>([&] { h.controller->dryRunJob(id); }));
    h.mount->current = MountStatus::Available;

    std::string missing = h.create(h.root / "nope", h.root / "dst");
    assert(Throws<ScanError>([&] { h.controller->dryRunJob(missing); }));

    WriteFile(h.root / "remote" / "r1", 5);
    std::string both = h.create(h.root / "src", h.root / "remote", SyncDirection::Bidirectional);
    DryRunReport bidi = h.controller->dryRunJob(both);
    assert(bidi.phases.size() == 2);
    assert(bidi.phases[1].phase == SyncPhase::Pull);
    assert(bidi.phases[1].sourcePath == (h.root / "remote").string());
    assert(bidi.phases[1].totalFiles == 1);

    h.copy->holdUntilReleased = true;
    h.controller->startJob(id);
    assert(h.copy->waitForStarted(1));
    assert(Throws<InvalidTransition>([&] { h.controller->dryRunJob(id); }));
    h.copy->release();
    assert(h.controller->waitForRun(id, kWait));
    std::cout << "[PASS] Dry run reports the plan without copying." << std::endl;
}

void TestStartRacingShutdown() {
    Harness h("race");
    for (int i = 0; i < 4; ++i) WriteFile(h.root / "src" / ("f" + std::to_string(i)), 10);
    h.copy->delay = std::chrono::milliseconds(30);

    std::vector<std::string> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(h.create(h.root / "src", h.root / ("dst" + std::to_string(i))));
    }

    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};
    std::thread starter([&]() {
        for (const auto& id : ids) {
            try {
                h.controller->startJob(id);
                ++accepted;
            } catch (const InvalidTransition&) {
                ++refused;
            }
        }
    });
    h.controller->shutdown();
    starter.join();

    assert(accepted + refused == 6);
    for (const auto& id : ids) {
        assert(!h.controller->hasLiveRun(id) && "shutdown outlives every accepted start");
        assert(!IsActive(h.controller->getJobStatus(id).state));
    }
    assert(Throws<InvalidTransition>([&] { h.controller->startJob(ids[0]); }));
    std::cout << "[PASS] Start racing shutdown leaves no run behind." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JobController Test..." << std::endl;
    TestEmptySourceCompletesWithoutRunning();
    TestMissingSourceFails();
    TestMountUnavailableFails();
    TestItemFailureCompletesWithErrors();
    TestCancelStopsInFlightCopies();
    TestCancelTerminatesHungTool();
    TestCancelMidRun();
    TestPauseResume();
    TestRestartReconciliation();
    TestBidirectional();
    TestValidationAndDelete();
    TestUpdateJob();
    TestDryRun();
    TestStartRacingShutdown();
    std::cout << "[PASS] JobController Test." << std::endl;
    return 0;
}
