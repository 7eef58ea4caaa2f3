/**
 * @file FilenameInspector.hpp
 * @brief Pre-flight check for names the destination filesystem may reject.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/sync/Job.hpp"
#include "infrastructure/sync/FileSystemItemScanner.hpp"

namespace parasync::infrastructure::sync {

class FilenameInspector {
public:
    /** @brief Upper bound on reported issues per run. */
    static constexpr std::size_t kMaxIssues = 1000;

    explicit FilenameInspector(const FileSystemItemScanner& scanner);

    /**
     * @brief Classifies a single path component.
     * @return Issue type ("colon", "control_char", "trailing_dot", ...) or nullopt.
     */
    static std::optional<std::string> checkName(const std::string& name);

    /** @brief Walks the whole tree below rootPath, honouring the scanner's excludes. */
    std::vector<domain::sync::FilenameIssue> inspect(const std::string& rootPath) const;

private:
    const FileSystemItemScanner& m_scanner;
};

} // namespace parasync::infrastructure::sync
