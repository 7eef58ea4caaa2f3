/**
 * @file AsyncTaskManager.hpp
 * @brief Owner of the controller's job-run and ticker threads.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iostream>
#include <iterator>

namespace parasync::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    JobRun,
    ProgressTicker
};

/**
 * @struct TaskStatus
 * @brief Completion flag and failure text of one submitted task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Owns background threads and provides unified status tracking.
 *
 * Threads are never detached: finished ones are joined on the next submit,
 * the rest by WaitAll() or the destructor.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        JoinCompletedTasks();

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_tasks.push_back(Entry{status, std::thread([status, userFunc = std::forward<F>(f)]() mutable {
            try {
                userFunc();
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
            }
            status->isCompleted = true;
        })});

        return status;
    }

    /** @brief Joins every task. Must not be called from a managed task. */
    void WaitAll() {
        std::vector<Entry> tasks;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            tasks.swap(m_tasks);
        }
        for (auto& entry : tasks) {
            if (entry.thread.joinable()) entry.thread.join();
        }
    }

private:
    struct Entry {
        std::shared_ptr<TaskStatus> status;
        std::thread thread;
    };

    void JoinCompletedTasks() {
        std::vector<Entry> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto it = std::stable_partition(m_tasks.begin(), m_tasks.end(),
                [](const Entry& e) { return !e.status->isCompleted.load(); });
            std::move(it, m_tasks.end(), std::back_inserter(finished));
            m_tasks.erase(it, m_tasks.end());
        }
        for (auto& entry : finished) {
            if (entry.thread.joinable()) entry.thread.join();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<Entry> m_tasks;
    std::mutex m_tasksMutex;
};

} // namespace parasync::application
