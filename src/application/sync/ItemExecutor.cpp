/**
 * @file ItemExecutor.cpp
 * @brief Implementation of ItemExecutor.
 */

#include "application/sync/ItemExecutor.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <sys/stat.h>

namespace parasync::application::sync {

namespace fs = std::filesystem;

using domain::sync::CopyRequest;
using domain::sync::Item;
using domain::sync::PlannedChange;

namespace {

std::string WithTrailingSlash(std::string path) {
    if (path.empty() || path.back() != '/') path += '/';
    return path;
}

std::string WithoutTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

} // namespace

ItemExecutor::ItemExecutor(std::shared_ptr<domain::sync::CopyExecutor> copyExecutor,
                           std::chrono::milliseconds progressInterval)
    : m_copyExecutor(std::move(copyExecutor)), m_progressInterval(progressInterval) {}

CopyRequest ItemExecutor::buildRequest(const Item& item, const CopyOptions& options) {
    CopyRequest request;
    request.options = options.flags;
    request.options.erase(std::remove(request.options.begin(), request.options.end(), "--info=progress2"),
                          request.options.end());
    request.options.push_back("--info=progress2");
    request.options.push_back("--no-inc-recursive");
    request.excludePatterns = options.excludePatterns;

    fs::path source = fs::path(WithoutTrailingSlash(options.sourceRoot)) / item.relativePath;
    fs::path dest = fs::path(WithoutTrailingSlash(options.destRoot));
    if (item.isDirectory) {
        // Copy the directory's contents into a same-named directory at the destination.
        request.sourcePath = WithTrailingSlash(source.string());
        request.destPath = WithTrailingSlash((dest / item.relativePath).string());
    } else {
        request.sourcePath = source.string();
        request.destPath = WithTrailingSlash(dest.string());
    }
    return request;
}

CopyRequest ItemExecutor::buildPreviewRequest(const CopyOptions& options) {
    static const std::vector<std::string> kReplaced = {"--dry-run", "-n", "--itemize-changes", "-i",
                                                       "--info=progress2"};
    CopyRequest request;
    for (const auto& flag : options.flags) {
        if (std::find(kReplaced.begin(), kReplaced.end(), flag) == kReplaced.end()) {
            request.options.push_back(flag);
        }
    }
    request.options.push_back("--dry-run");
    request.options.push_back("--itemize-changes");
    request.excludePatterns = options.excludePatterns;
    request.sourcePath = WithTrailingSlash(options.sourceRoot);
    request.destPath = WithTrailingSlash(options.destRoot);
    return request;
}

std::optional<PlannedChange> ItemExecutor::parseItemizeLine(const std::string& line) {
    PlannedChange change;
    if (line.rfind("*deleting", 0) == 0) {
        auto start = line.find_first_not_of(' ', 9);
        if (start == std::string::npos) return std::nullopt;
        change.path = line.substr(start);
        change.action = "delete";
    } else {
        // YXcstpoguax: update type, file type, then nine attribute flags.
        if (line.size() <= 12 || std::string("<>ch").find(line[0]) == std::string::npos || line[11] != ' ') {
            return std::nullopt;
        }
        std::string code = line.substr(0, 11);
        change.path = line.substr(12);
        change.action = code.find('+') != std::string::npos ? "transfer" : "update";
        change.isDirectory = code[1] == 'd';
    }

    if (!change.path.empty() && change.path.back() == '/') {
        change.isDirectory = true;
        change.path.pop_back();
    }
    if (change.path.empty() || change.path == ".") return std::nullopt;
    return change;
}

std::optional<ProgressLine> ItemExecutor::parseProgressLine(const std::string& line) {
    // Example: "    1,234,567  45%   12.34MB/s    0:01:23"
    static const std::regex kProgress(R"(^\s*([\d,]+)\s+(\d+)%\s+([\d.]+\S*/s))");
    std::smatch match;
    if (!std::regex_search(line, match, kProgress)) {
        return std::nullopt;
    }

    std::string digits = match[1].str();
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());

    ProgressLine parsed;
    try {
        parsed.bytesTransferred = std::stoull(digits);
        parsed.percent = std::stoi(match[2].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
    parsed.rate = match[3].str();
    return parsed;
}

bool ItemExecutor::isErrorLine(const std::string& line) {
    return line.rfind("rsync:", 0) == 0 || line.rfind("rsync error:", 0) == 0;
}

ItemResult ItemExecutor::execute(const Item& item,
                                 const CopyOptions& options,
                                 OnProgress onProgress,
                                 domain::sync::CopyExecutor::ShouldStop shouldStop) const {
    ItemResult result;
    CopyRequest request = buildRequest(item, options);

    std::string firstError;
    auto lastNotify = std::chrono::steady_clock::time_point{};

    auto outcome = m_copyExecutor->execute(request, [&](const std::string& line) {
        if (isErrorLine(line)) {
            if (firstError.empty()) firstError = line;
            return;
        }
        auto progress = parseProgressLine(line);
        if (!progress || !onProgress) return;

        auto now = std::chrono::steady_clock::now();
        if (now - lastNotify < m_progressInterval) return;
        lastNotify = now;
        // The tool may count more than the scanned size (e.g. files that grew); clamp.
        onProgress(std::min<std::uint64_t>(progress->bytesTransferred, item.sizeBytes), progress->rate);
    }, std::move(shouldStop));

    result.exitCode = outcome.exitCode;
    result.success = outcome.succeeded();
    result.stopped = outcome.stopped;
    if (!result.success) {
        if (outcome.stopped) {
            result.message = "Copy of " + item.relativePath + " stopped by cancel";
        } else if (!outcome.errorMessage.empty()) {
            result.message = outcome.errorMessage;
        } else if (!firstError.empty()) {
            result.message = firstError + " (exit code " + std::to_string(outcome.exitCode) + ")";
        } else {
            result.message = "Failed to sync " + item.relativePath + ": exit code " + std::to_string(outcome.exitCode);
        }
    }
    return result;
}

PreviewResult ItemExecutor::preview(const CopyOptions& options) const {
    PreviewResult result;
    CopyRequest request = buildPreviewRequest(options);

    auto outcome = m_copyExecutor->execute(request, [&](const std::string& line) {
        if (isErrorLine(line)) {
            result.errors.push_back(line);
            return;
        }
        auto change = parseItemizeLine(line);
        if (!change) return;
        if (!change->isDirectory && change->action != "delete") {
            std::string path = (fs::path(WithoutTrailingSlash(options.sourceRoot)) / change->path).string();
            struct stat st;
            if (::lstat(path.c_str(), &st) == 0) {
                change->sizeBytes = static_cast<std::uint64_t>(st.st_size);
            }
        }
        result.changes.push_back(std::move(*change));
    }, nullptr);

    result.exitCode = outcome.exitCode;
    if (!outcome.errorMessage.empty()) {
        result.errors.push_back(outcome.errorMessage);
    }
    return result;
}

} // namespace parasync::application::sync
