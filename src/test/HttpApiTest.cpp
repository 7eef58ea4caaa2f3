#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

#include "application/sync/JobController.hpp"
#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/sync/JobRepositoryFs.hpp"
#include "test/FakeCopyExecutor.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace parasync::application::sync;
using parasync::infrastructure::HttpApiServer;
using parasync::infrastructure::PersistenceService;
using parasync::infrastructure::sync::JobRepositoryFs;

int main() {
    std::cout << "[Test] Starting HTTP API Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / ("parasync_http_" + std::to_string(::getpid()));
    fs::remove_all(root);
    fs::create_directories(root / "src" / "dir");
    std::ofstream(root / "src" / "dir" / "file.bin") << "payload";

    auto persistence = std::make_shared<PersistenceService>();
    auto repository = std::make_shared<JobRepositoryFs>((root / "state").string(), persistence);
    auto copy = std::make_shared<FakeCopyExecutor>();
    auto mount = std::make_shared<FakeMountMonitor>();
    ControllerSettings settings;
    settings.persistInterval = std::chrono::milliseconds(50);
    auto controller = std::make_shared<JobController>(repository, std::make_shared<ItemExecutor>(copy), mount, settings);

    HttpApiServer server(controller, mount);
    int port = server.bindToAnyPort("127.0.0.1");
    assert(port > 0);
    std::thread serving([&server]() { server.listenAfterBind(); });
    while (!server.isRunning()) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    httplib::Client cli("127.0.0.1", port);

    // Create
    json body = {
        {"name", "api"},
        {"sourcePath", (root / "src").string()},
        {"destPath", (root / "dst").string()},
        {"direction", "push"},
        {"parallelism", 2},
        {"excludePatterns", {"*.tmp"}}
    };
    auto res = cli.Post("/api/jobs", body.dump(), "application/json");
    assert(res && res->status == 201);
    std::string id = json::parse(res->body).at("id").get<std::string>();

    // Validation errors map to 400
    res = cli.Post("/api/jobs", json{{"sourcePath", "/a"}, {"destPath", "/b"}, {"parallelism", 0}}.dump(), "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/jobs", json{{"sourcePath", "/a"}, {"destPath", "/b"}, {"direction", "up"}}.dump(), "application/json");
    assert(res && res->status == 400);
    res = cli.Post("/api/jobs", "not json", "application/json");
    assert(res && res->status == 400);

    // Unknown job maps to 404, illegal transition to 409
    res = cli.Get("/api/jobs/does-not-exist");
    assert(res && res->status == 404);
    res = cli.Post("/api/jobs/" + id + "/pause", "", "application/json");
    assert(res && res->status == 409);

    // Edit an idle job
    res = cli.Put("/api/jobs/" + id, json{{"name", "renamed"}, {"parallelism", 3}}.dump(), "application/json");
    assert(res && res->status == 200);
    json edited = json::parse(res->body);
    assert(edited.at("name") == "renamed");
    assert(edited.at("parallelism") == 3);
    assert(edited.at("excludePatterns").size() == 1 && "fields left out of the body are kept");
    res = cli.Put("/api/jobs/" + id, json{{"parallelism", 0}}.dump(), "application/json");
    assert(res && res->status == 400);
    res = cli.Put("/api/jobs/does-not-exist", json{{"name", "x"}}.dump(), "application/json");
    assert(res && res->status == 404);

    // Dry run
    copy->dryRunOutput = {"cd+++++++++ dir/", ">f+++++++++ dir/file.bin"};
    res = cli.Post("/api/jobs/" + id + "/dry-run", "", "application/json");
    assert(res && res->status == 200);
    json plan = json::parse(res->body);
    assert(plan.at("jobId") == id);
    assert(plan.at("phases").size() == 1);
    assert(plan.at("phases")[0].at("filesToTransfer") == 1);
    assert(plan.at("phases")[0].at("bytesToTransfer") == 7);
    assert(plan.at("phases")[0].at("changes").size() == 2);
    assert(copy->started().empty() && "a dry run copies nothing");
    res = cli.Post("/api/jobs/does-not-exist/dry-run", "", "application/json");
    assert(res && res->status == 404);
    mount->current = parasync::domain::sync::MountStatus::Disconnected;
    res = cli.Post("/api/jobs/" + id + "/dry-run", "", "application/json");
    assert(res && res->status == 503);
    mount->current = parasync::domain::sync::MountStatus::Available;

    // Start; edits and dry runs are refused while the run is live
    copy->holdUntilReleased = true;
    res = cli.Post("/api/jobs/" + id + "/start", "", "application/json");
    assert(res && res->status == 200);
    assert(copy->waitForStarted(1));
    res = cli.Put("/api/jobs/" + id, json{{"name", "busy"}}.dump(), "application/json");
    assert(res && res->status == 409);
    res = cli.Post("/api/jobs/" + id + "/dry-run", "", "application/json");
    assert(res && res->status == 409);
    copy->release();
    assert(controller->waitForRun(id, std::chrono::seconds(20)));

    res = cli.Get("/api/jobs/" + id);
    assert(res && res->status == 200);
    json job = json::parse(res->body);
    assert(job.at("state") == "Completed");
    assert(job.at("parallelism") == 3);

    res = cli.Get("/api/jobs/" + id + "/progress");
    assert(res && res->status == 200);
    json progress = json::parse(res->body);
    assert(progress.at("totalFiles") == 1);
    assert(progress.at("filesDone") == 1);

    res = cli.Get("/api/jobs");
    assert(res && res->status == 200);
    assert(json::parse(res->body).at("jobs").size() == 1);

    res = cli.Get("/api/status");
    assert(res && res->status == 200);
    json status = json::parse(res->body);
    assert(status.at("mount").at("status") == "available");
    assert(status.at("jobs") == 1);

    res = cli.Delete("/api/jobs/" + id);
    assert(res && res->status == 204);
    res = cli.Get("/api/jobs/" + id);
    assert(res && res->status == 404);

    server.stop();
    serving.join();
    controller->shutdown();
    persistence->stop();
    fs::remove_all(root);

    std::cout << "[PASS] HTTP API Test." << std::endl;
    return 0;
}
