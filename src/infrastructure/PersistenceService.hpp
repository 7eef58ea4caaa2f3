/**
 * @file PersistenceService.hpp
 * @brief Single writer thread for job records and other state files.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace parasync::infrastructure {

/**
 * @struct SaveTask
 * @brief Full replacement content for one file.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Queues whole-file writes and applies them in order on one thread.
 *
 * Each write lands as temp file, fsync, rename. Readers see either the old
 * document or the new one, never a mix, and two writers to the same path
 * cannot interleave.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues content to replace filename. Parent directories are created.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every write queued before this call is on disk.
     * @return False if any of those writes failed.
     */
    bool flush();

    /** @brief Drains the queue, then stops the writer. Idempotent. */
    void stop();

private:
    void workerLoop();
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_writing = false;
    std::size_t m_failedWrites = 0;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace parasync::infrastructure
