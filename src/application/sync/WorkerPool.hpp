/**
 * @file WorkerPool.hpp
 * @brief Concurrent worker lanes, each processing its assignment strictly in order.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/sync/ItemExecutor.hpp"
#include "domain/sync/Item.hpp"
#include "domain/sync/WorkerEvents.hpp"

namespace parasync::application::sync {

/**
 * @class RunControl
 * @brief Pause and cancel flags shared by the controller and all workers of one run.
 *
 * Pause is honoured between items; an item that already started copies to the
 * end. Cancel also stops in-flight copies: the copy tool is polled against
 * isCancelled() and terminated once it turns true.
 */
class RunControl {
public:
    void pause();
    void resume();
    void cancel();

    bool isPaused() const;
    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Blocks while paused.
     * @return False if the run was cancelled, true if the worker may dispatch its next item.
     */
    bool waitUntilDispatchAllowed();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_paused = false;
    std::atomic<bool> m_cancelled{false};
};

/**
 * @class WorkerPool
 * @brief Runs one thread per assignment and reports through an event sink.
 *
 * No work stealing: each worker keeps the items the Batcher gave it. Event
 * order per worker is WorkerStarted, then per item ItemStarted, ItemProgress*,
 * ItemCompleted|ItemFailed, and finally WorkerFinished.
 */
class WorkerPool {
public:
    /** @brief Receives events from all workers concurrently; must be thread-safe. */
    using EventSink = std::function<void(const domain::sync::WorkerEvent&)>;

    explicit WorkerPool(std::shared_ptr<ItemExecutor> itemExecutor);

    /**
     * @brief Executes all assignments. Blocks until every worker has finished or stopped.
     */
    void run(const std::string& jobId,
             const std::vector<domain::sync::WorkerAssignment>& assignments,
             const CopyOptions& options,
             RunControl& control,
             const EventSink& sink);

private:
    void runWorker(const std::string& jobId,
                   const domain::sync::WorkerAssignment& assignment,
                   const CopyOptions& options,
                   RunControl& control,
                   const EventSink& sink);

    std::shared_ptr<ItemExecutor> m_itemExecutor;
};

} // namespace parasync::application::sync
