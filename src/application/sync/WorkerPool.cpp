/**
 * @file WorkerPool.cpp
 * @brief Implementation of WorkerPool and RunControl.
 */

#include "application/sync/WorkerPool.hpp"

#include <iostream>
#include <thread>

namespace parasync::application::sync {

using namespace parasync::domain::sync;

void RunControl::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paused = true;
}

void RunControl::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_paused = false;
    }
    m_cv.notify_all();
}

void RunControl::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool RunControl::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

bool RunControl::waitUntilDispatchAllowed() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_paused || m_cancelled.load(); });
    return !m_cancelled.load();
}

WorkerPool::WorkerPool(std::shared_ptr<ItemExecutor> itemExecutor)
    : m_itemExecutor(std::move(itemExecutor)) {}

void WorkerPool::run(const std::string& jobId,
                     const std::vector<WorkerAssignment>& assignments,
                     const CopyOptions& options,
                     RunControl& control,
                     const EventSink& sink) {
    std::vector<std::thread> workers;
    workers.reserve(assignments.size());

    for (const auto& assignment : assignments) {
        workers.emplace_back([this, &jobId, &assignment, &options, &control, &sink]() {
            runWorker(jobId, assignment, options, control, sink);
        });
    }

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::runWorker(const std::string& jobId,
                           const WorkerAssignment& assignment,
                           const CopyOptions& options,
                           RunControl& control,
                           const EventSink& sink) {
    const int index = assignment.workerIndex;
    sink(WorkerStarted{index, assignment.items.size()});

    bool cancelled = false;
    for (const auto& item : assignment.items) {
        if (!control.waitUntilDispatchAllowed()) {
            cancelled = true;
            break;
        }

        sink(ItemStarted{index, item});

        ItemResult result;
        try {
            result = m_itemExecutor->execute(
                item, options,
                [&](std::uint64_t bytes, const std::string& rate) {
                    sink(ItemProgress{index, item, bytes, rate});
                },
                [&control]() { return control.isCancelled(); });
        } catch (const std::exception& e) {
            result.success = false;
            result.message = "Error syncing " + item.relativePath + ": " + e.what();
        }

        if (result.success) {
            sink(ItemCompleted{index, item});
        } else {
            std::cerr << "[WorkerPool] Job " << jobId << " worker " << index << ": " << result.message << std::endl;
            sink(ItemFailed{index, item, result.message});
        }
        if (result.stopped) {
            cancelled = true;
            break;
        }
    }

    sink(WorkerFinished{index, cancelled});
}

} // namespace parasync::application::sync
