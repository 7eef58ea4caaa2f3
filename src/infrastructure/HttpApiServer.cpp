#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/sync/JobRecordCodec.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace parasync::infrastructure {

using json = nlohmann::json;
using namespace parasync::domain::sync;
using application::sync::CreateJobRequest;
using application::sync::JobController;
using application::sync::UpdateJobRequest;
using sync::JobRecordCodec;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, json{{"error", message}});
}

/**
 * Runs a handler body and maps the error taxonomy onto HTTP status codes.
 */
template <typename F>
void Guarded(httplib::Response& res, F&& body) {
    try {
        body();
    } catch (const JobNotFound& e) {
        SendError(res, 404, e.what());
    } catch (const InvalidTransition& e) {
        SendError(res, 409, e.what());
    } catch (const ConfigError& e) {
        SendError(res, 400, e.what());
    } catch (const ScanError& e) {
        SendError(res, 422, e.what());
    } catch (const MountUnavailable& e) {
        SendError(res, 503, e.what());
    } catch (const json::exception& e) {
        SendError(res, 400, std::string("Malformed request: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HttpApiServer] Internal error: " << e.what() << std::endl;
        SendError(res, 500, e.what());
    }
}

CreateJobRequest ParseCreateRequest(const std::string& body) {
    json j = json::parse(body);
    if (!j.is_object()) {
        throw ConfigError(ConfigError::Kind::InvalidPath, "Request body must be a JSON object");
    }

    CreateJobRequest request;
    request.name = j.value("name", std::string());
    request.sourcePath = j.value("sourcePath", std::string());
    request.destPath = j.value("destPath", std::string());
    if (j.contains("direction")) {
        request.direction = JobController::parseDirection(j.at("direction").get<std::string>());
    }
    if (j.contains("parallelism")) {
        request.parallelism = j.at("parallelism").get<int>();
    }
    if (j.contains("excludePatterns")) {
        request.excludePatterns = j.at("excludePatterns").get<std::set<std::string>>();
    }
    if (j.contains("copyOptions")) {
        request.copyOptions = j.at("copyOptions").get<std::string>();
    }
    return request;
}

UpdateJobRequest ParseUpdateRequest(const std::string& body) {
    json j = json::parse(body);
    if (!j.is_object()) {
        throw ConfigError(ConfigError::Kind::InvalidPath, "Request body must be a JSON object");
    }

    UpdateJobRequest request;
    if (j.contains("name")) request.name = j.at("name").get<std::string>();
    if (j.contains("sourcePath")) request.sourcePath = j.at("sourcePath").get<std::string>();
    if (j.contains("destPath")) request.destPath = j.at("destPath").get<std::string>();
    if (j.contains("direction")) {
        request.direction = JobController::parseDirection(j.at("direction").get<std::string>());
    }
    if (j.contains("parallelism")) request.parallelism = j.at("parallelism").get<int>();
    if (j.contains("excludePatterns")) {
        request.excludePatterns = j.at("excludePatterns").get<std::set<std::string>>();
    }
    if (j.contains("copyOptions")) request.copyOptions = j.at("copyOptions").get<std::string>();
    return request;
}

} // namespace

HttpApiServer::HttpApiServer(std::shared_ptr<JobController> controller,
                             std::shared_ptr<MountMonitor> mountMonitor)
    : m_controller(std::move(controller))
    , m_mountMonitor(std::move(mountMonitor))
    , m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpApiServer::~HttpApiServer() {
    stop();
}

void HttpApiServer::registerRoutes() {
    m_server->Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            std::string id = m_controller->createJob(ParseCreateRequest(req.body));
            SendJson(res, 201, json{{"id", id}});
        });
    });

    m_server->Get("/api/jobs", [this](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] {
            json jobs = json::array();
            for (const auto& job : m_controller->listJobs()) {
                jobs.push_back(JobRecordCodec::toSummaryJson(job));
            }
            SendJson(res, 200, json{{"jobs", jobs}});
        });
    });

    m_server->Get(R"(/api/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            SendJson(res, 200, JobRecordCodec::toJson(m_controller->getJobStatus(req.matches[1])));
        });
    });

    m_server->Put(R"(/api/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            Job job = m_controller->updateJob(req.matches[1], ParseUpdateRequest(req.body));
            SendJson(res, 200, JobRecordCodec::toJson(job));
        });
    });

    m_server->Post(R"(/api/jobs/([^/]+)/dry-run)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            SendJson(res, 200, JobRecordCodec::toJson(m_controller->dryRunJob(req.matches[1])));
        });
    });

    m_server->Get(R"(/api/jobs/([^/]+)/progress)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            SendJson(res, 200, JobRecordCodec::toJson(m_controller->getProgress(req.matches[1])));
        });
    });

    m_server->Post(R"(/api/jobs/([^/]+)/(start|pause|resume|cancel))",
                   [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            const std::string id = req.matches[1];
            const std::string action = req.matches[2];
            if (action == "start") m_controller->startJob(id);
            else if (action == "pause") m_controller->pauseJob(id);
            else if (action == "resume") m_controller->resumeJob(id);
            else m_controller->cancelJob(id);

            Job job = m_controller->getJobStatus(id);
            SendJson(res, 200, json{{"id", id}, {"state", StateToString(job.state)}});
        });
    });

    m_server->Delete(R"(/api/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded(res, [&] {
            m_controller->deleteJob(req.matches[1]);
            res.status = 204;
        });
    });

    m_server->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        Guarded(res, [&] {
            json counts = json::object();
            std::size_t active = 0;
            auto jobs = m_controller->listJobs();
            for (const auto& job : jobs) {
                counts[StateToString(job.state)] = counts.value(StateToString(job.state), 0) + 1;
                if (IsActive(job.state)) ++active;
            }

            json body{{"jobs", jobs.size()}, {"activeJobs", active}, {"byState", counts}};
            if (m_mountMonitor) {
                body["mount"] = {
                    {"path", m_mountMonitor->mountPoint()},
                    {"status", MountStatusToString(m_mountMonitor->status())}
                };
            } else {
                body["mount"] = nullptr;
            }
            SendJson(res, 200, body);
        });
    });

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (res.status >= 400) {
            std::cerr << "[HttpApiServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
        }
    });
}

bool HttpApiServer::listen(const std::string& host, int port) {
    std::cout << "[HttpApiServer] Listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[HttpApiServer] Cannot listen on " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

int HttpApiServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool HttpApiServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void HttpApiServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool HttpApiServer::isRunning() const {
    return m_server && m_server->is_running();
}

} // namespace parasync::infrastructure
