/**
 * @file ItemExecutor.hpp
 * @brief Runs the copy tool for one assigned item and classifies the outcome.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/sync/CopyExecutor.hpp"
#include "domain/sync/DryRunReport.hpp"
#include "domain/sync/Item.hpp"

namespace parasync::application::sync {

/**
 * @struct CopyOptions
 * @brief Per-run settings shared by every item of a phase.
 */
struct CopyOptions {
    std::string sourceRoot;
    std::string destRoot;
    std::vector<std::string> flags;           ///< e.g. {"-av"}
    std::vector<std::string> excludePatterns;
};

/**
 * @struct ItemResult
 * @brief Terminal per-item outcome.
 */
struct ItemResult {
    bool success = false;
    bool stopped = false; ///< The copy was cut short by a cancel.
    int exitCode = 0;
    std::string message; ///< Failure description; first tool error line if any.
};

/**
 * @struct PreviewResult
 * @brief Change list from a dry run of the tool over a whole root.
 */
struct PreviewResult {
    std::vector<domain::sync::PlannedChange> changes;
    std::vector<std::string> errors;
    int exitCode = 0;
};

/**
 * @struct ProgressLine
 * @brief Fields parsed from one --info=progress2 line.
 */
struct ProgressLine {
    std::uint64_t bytesTransferred = 0;
    int percent = 0;
    std::string rate;
};

/**
 * @class ItemExecutor
 * @brief Translates an Item into a copy tool invocation and watches its output.
 *
 * Stateless apart from configuration, so one instance serves all workers.
 */
class ItemExecutor {
public:
    using OnProgress = std::function<void(std::uint64_t bytesTransferred, const std::string& rate)>;

    explicit ItemExecutor(std::shared_ptr<domain::sync::CopyExecutor> copyExecutor,
                          std::chrono::milliseconds progressInterval = std::chrono::milliseconds(500));

    /**
     * @brief Copies one item. Blocks until the tool exits or shouldStop turns true.
     * @param onProgress Invoked at most once per progress interval.
     * @param shouldStop Polled while the tool runs; true terminates the copy.
     */
    ItemResult execute(const domain::sync::Item& item,
                       const CopyOptions& options,
                       OnProgress onProgress,
                       domain::sync::CopyExecutor::ShouldStop shouldStop = nullptr) const;

    /**
     * @brief Asks the tool what a copy of the whole source root would change. Nothing is written.
     */
    PreviewResult preview(const CopyOptions& options) const;

    /** @brief Builds the tool request for an item. */
    static domain::sync::CopyRequest buildRequest(const domain::sync::Item& item, const CopyOptions& options);

    /** @brief Root-to-root request with dry-run and itemized output forced on. */
    static domain::sync::CopyRequest buildPreviewRequest(const CopyOptions& options);

    /** @brief Parses one itemize-changes line (">f+++++++++ a.txt", "*deleting   b"). */
    static std::optional<domain::sync::PlannedChange> parseItemizeLine(const std::string& line);

    /** @brief Best-effort parse of a progress line; nullopt for anything else. */
    static std::optional<ProgressLine> parseProgressLine(const std::string& line);

    /** @brief True for diagnostics the tool prints on failure ("rsync: ...", "rsync error: ..."). */
    static bool isErrorLine(const std::string& line);

private:
    std::shared_ptr<domain::sync::CopyExecutor> m_copyExecutor;
    std::chrono::milliseconds m_progressInterval;
};

} // namespace parasync::application::sync
