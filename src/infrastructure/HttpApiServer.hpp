/**
 * @file HttpApiServer.hpp
 * @brief REST surface over the job management operations.
 */

#pragma once

#include <memory>
#include <string>

#include "application/sync/JobController.hpp"
#include "domain/sync/MountMonitor.hpp"

namespace httplib {
class Server;
}

namespace parasync::infrastructure {

/**
 * @class HttpApiServer
 * @brief JSON API served by cpp-httplib.
 *
 * Routes:
 *   POST   /api/jobs                    create
 *   GET    /api/jobs                    list (summaries, oldest first)
 *   GET    /api/jobs/{id}               full record
 *   PUT    /api/jobs/{id}               edit an idle job (partial body)
 *   GET    /api/jobs/{id}/progress      live snapshot
 *   POST   /api/jobs/{id}/start|pause|resume|cancel
 *   POST   /api/jobs/{id}/dry-run       preview without copying
 *   DELETE /api/jobs/{id}
 *   GET    /api/status                  mount status and job counts
 *
 * Errors map to 400 (ConfigError, malformed body), 404 (JobNotFound),
 * 409 (InvalidTransition), 422 (ScanError) and 503 (MountUnavailable).
 */
class HttpApiServer {
public:
    HttpApiServer(std::shared_ptr<application::sync::JobController> controller,
                  std::shared_ptr<domain::sync::MountMonitor> mountMonitor);
    ~HttpApiServer();

    /** @brief Binds and serves until stop(). Returns false if the port cannot be bound. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to a free port. @return The port, or -1. */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on a socket bound by bindToAnyPort(). Blocks until stop(). */
    bool listenAfterBind();

    void stop();

    bool isRunning() const;

private:
    std::shared_ptr<application::sync::JobController> m_controller;
    std::shared_ptr<domain::sync::MountMonitor> m_mountMonitor;
    std::unique_ptr<httplib::Server> m_server;

    void registerRoutes();
};

} // namespace parasync::infrastructure
