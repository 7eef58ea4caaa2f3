/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace parasync::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Dropping write after stop: " << filename << std::endl;
            return;
        }
        m_queue.push(SaveTask{filename, content});
    }
    m_cv.notify_one();
}

bool PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    std::size_t failedBefore = m_failedWrites;
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_writing;
    });
    return m_failedWrites == failedBefore;
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_writing = true;
        }

        // Process outside lock
        bool ok = performAtomicWrite(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_writing = false;
            if (!ok) ++m_failedWrites;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Make the bytes durable before they become visible under the final name
    int fd = ::open(tempPath.c_str(), O_RDONLY);
    if (fd < 0 || ::fsync(fd) != 0) {
        std::cerr << "[PersistenceService] fsync failed: " << tempPath << std::endl;
        if (fd >= 0) ::close(fd);
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }
    ::close(fd);

    // 4. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace parasync::infrastructure
