#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace parasync::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgDir(const char* variable, const fs::path& underHome) {
    const char* value = std::getenv(variable);
    // Relative XDG values are invalid and ignored.
    if (value && *value == '/') {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / underHome;
    }
    return fs::current_path() / underHome;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetStateHome() {
    return XdgDir("XDG_STATE_HOME", fs::path(".local") / "state");
}

} // namespace parasync::infrastructure
