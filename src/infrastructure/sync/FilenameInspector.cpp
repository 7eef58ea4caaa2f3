#include "infrastructure/sync/FilenameInspector.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace parasync::infrastructure::sync {

namespace {

const std::pair<char, const char*> kReservedChars[] = {
    {'\\', "backslash"},
    {':', "colon"},
    {'*', "asterisk"},
    {'?', "question_mark"},
    {'"', "double_quote"},
    {'<', "less_than"},
    {'>', "greater_than"},
    {'|', "pipe"},
};

} // namespace

FilenameInspector::FilenameInspector(const FileSystemItemScanner& scanner)
    : m_scanner(scanner) {}

std::optional<std::string> FilenameInspector::checkName(const std::string& name) {
    for (const auto& [ch, type] : kReservedChars) {
        if (name.find(ch) != std::string::npos) return std::string(type);
    }
    for (unsigned char c : name) {
        if (c < 0x20) return std::string("control_char");
    }
    if (!name.empty() && name.front() == ' ') return std::string("leading_space");
    if (!name.empty() && name.back() == ' ') return std::string("trailing_space");
    if (!name.empty() && name.back() == '.' && name != "." && name != "..") return std::string("trailing_dot");
    if (name.size() > 255) return std::string("too_long");
    return std::nullopt;
}

std::vector<domain::sync::FilenameIssue> FilenameInspector::inspect(const std::string& rootPath) const {
    std::vector<domain::sync::FilenameIssue> issues;

    std::error_code ec;
    fs::recursive_directory_iterator walker(rootPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) return issues;

    for (auto end = fs::recursive_directory_iterator(); walker != end; walker.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        const auto& entry = *walker;
        std::string name = entry.path().filename().string();
        if (m_scanner.isExcluded(name)) {
            if (walker.recursion_pending()) walker.disable_recursion_pending();
            continue;
        }

        auto issue = checkName(name);
        if (!issue) continue;

        bool isDir = fs::is_directory(entry.symlink_status(ec));
        ec.clear();
        issues.push_back({fs::relative(entry.path(), rootPath, ec).string(), isDir, *issue});
        ec.clear();
        if (issues.size() >= kMaxIssues) break;
    }
    return issues;
}

} // namespace parasync::infrastructure::sync
