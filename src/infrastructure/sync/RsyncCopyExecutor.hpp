#pragma once

#include "domain/sync/CopyExecutor.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace parasync::infrastructure::sync {

/**
 * @class RsyncCopyExecutor
 * @brief Runs rsync (or a compatible binary) as a child process and streams its combined output.
 *
 * The child gets its own process group. On a stop request the group receives
 * SIGTERM, then SIGKILL once stopGrace has elapsed. The child is always reaped
 * before execute() returns, including when onLine throws.
 */
class RsyncCopyExecutor : public domain::sync::CopyExecutor {
public:
    explicit RsyncCopyExecutor(std::string binaryPath = "rsync",
                               std::chrono::milliseconds stopGrace = std::chrono::seconds(5));
    ~RsyncCopyExecutor() override = default;

    domain::sync::CopyOutcome execute(const domain::sync::CopyRequest& request,
                                      OnLine onLine,
                                      ShouldStop shouldStop) override;

    /** @brief argv for a request, binary first. */
    std::vector<std::string> buildArguments(const domain::sync::CopyRequest& request) const;

private:
    std::string m_binaryPath;
    std::chrono::milliseconds m_stopGrace;
};

} // namespace parasync::infrastructure::sync
