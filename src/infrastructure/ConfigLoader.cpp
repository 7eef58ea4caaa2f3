/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

namespace parasync::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* Env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int EnvInt(const char* name, int fallback) {
    const char* value = Env(name);
    if (!value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] Ignoring non-numeric " << name << "=" << value << std::endl;
        return fallback;
    }
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string ConfigLoader::DefaultConfigPath() {
    return (PathUtils::GetConfigHome() / "ParaSync" / "settings.json").string();
}

std::vector<std::string> ConfigLoader::SplitList(const std::string& value, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, separator)) {
        part = Trim(part);
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

SyncSettings ConfigLoader::Load(const std::string& configPath) {
    SyncSettings settings;
    settings.stateDir = (PathUtils::GetDataHome() / "ParaSync").string();
    settings.logDir = (PathUtils::GetStateHome() / "ParaSync" / "log").string();

    fs::path path = configPath.empty() ? fs::path(DefaultConfigPath()) : fs::path(configPath);
    if (fs::exists(path)) {
        try {
            std::ifstream f(path);
            nlohmann::json j;
            f >> j;

            settings.stateDir = j.value("state_dir", settings.stateDir);
            settings.logDir = j.value("log_dir", settings.logDir);
            settings.mountPoint = j.value("mount_point", settings.mountPoint);
            settings.requireMountEntry = j.value("require_mount_entry", settings.requireMountEntry);
            settings.defaultParallelism = j.value("parallel_jobs", settings.defaultParallelism);
            settings.rsyncBinary = j.value("rsync_binary", settings.rsyncBinary);
            settings.rsyncOptions = j.value("rsync_options", settings.rsyncOptions);
            settings.defaultExcludes = j.value("exclude_patterns", settings.defaultExcludes);
            settings.httpHost = j.value("http_host", settings.httpHost);
            settings.httpPort = j.value("http_port", settings.httpPort);
            settings.persistIntervalMs = j.value("persist_interval_ms", settings.persistIntervalMs);
            settings.stopGraceMs = j.value("stop_grace_ms", settings.stopGraceMs);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        }
    } else if (!configPath.empty()) {
        std::cerr << "[ConfigLoader] Config file not found, using defaults: " << path << std::endl;
    }

    ApplyEnvironment(settings);
    return settings;
}

void ConfigLoader::ApplyEnvironment(SyncSettings& settings) {
    if (const char* v = Env("PARASYNC_STATE_DIR")) settings.stateDir = v;
    if (const char* v = Env("PARASYNC_LOG_DIR")) settings.logDir = v;
    if (const char* v = Env("LUCIDLINK_MOUNT_POINT")) settings.mountPoint = v;
    if (const char* v = Env("RSYNC_BINARY")) settings.rsyncBinary = v;
    if (const char* v = Env("RSYNC_OPTIONS")) settings.rsyncOptions = v;
    if (const char* v = Env("SYNC_EXCLUDE")) settings.defaultExcludes = SplitList(v);
    settings.defaultParallelism = EnvInt("PARALLEL_JOBS", settings.defaultParallelism);
    settings.httpPort = EnvInt("WEBUI_PORT", settings.httpPort);
    settings.persistIntervalMs = EnvInt("PARASYNC_PERSIST_INTERVAL_MS", settings.persistIntervalMs);
    settings.stopGraceMs = EnvInt("PARASYNC_STOP_GRACE_MS", settings.stopGraceMs);
}

} // namespace parasync::infrastructure
