/**
 * @file CopyExecutor.hpp
 * @brief Interface to the external copy tool.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace parasync::domain::sync {

/**
 * @struct CopyRequest
 * @brief One invocation of the copy tool.
 */
struct CopyRequest {
    std::string sourcePath;              ///< Item path; directories end with '/'.
    std::string destPath;                ///< Target; directories end with '/'.
    std::vector<std::string> options;    ///< Transfer flags, already split.
    std::vector<std::string> excludePatterns;
};

/**
 * @struct CopyOutcome
 * @brief Result of a finished invocation.
 */
struct CopyOutcome {
    int exitCode = 0;
    std::string errorMessage; ///< Set when the tool could not be launched.
    bool stopped = false;     ///< The tool was terminated because a stop was requested.

    bool succeeded() const { return exitCode == 0 && errorMessage.empty() && !stopped; }
};

/**
 * @class CopyExecutor
 * @brief Runs the copy tool as a black box and streams its output lines.
 *
 * execute() blocks until the tool exits. It may be called concurrently from
 * several worker threads. shouldStop is polled while the tool runs; once it
 * returns true the executor terminates the tool instead of waiting for it.
 */
class CopyExecutor {
public:
    virtual ~CopyExecutor() = default;

    /** @brief Callback for each line (progress or diagnostics) the tool writes. */
    using OnLine = std::function<void(const std::string& line)>;

    /** @brief Polled while the tool runs. May be empty. */
    using ShouldStop = std::function<bool()>;

    virtual CopyOutcome execute(const CopyRequest& request, OnLine onLine, ShouldStop shouldStop) = 0;
};

} // namespace parasync::domain::sync
