/**
 * @file ProgressAggregator.cpp
 * @brief Implementation of ProgressAggregator.
 */

#include "application/sync/ProgressAggregator.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace parasync::application::sync {

using namespace parasync::domain::sync;

void ProgressAggregator::beginPhase(const std::vector<WorkerAssignment>& assignments) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot.perWorker.clear();
    m_workerFailed.assign(assignments.size(), false);

    for (const auto& assignment : assignments) {
        m_snapshot.totalFiles += assignment.fileCount();
        m_snapshot.totalBytes += assignment.loadBytes;

        WorkerProgress wp;
        wp.itemsTotal = assignment.items.size();
        m_snapshot.perWorker[assignment.workerIndex] = wp;
    }
    m_snapshot.activeWorkers = 0;
}

void ProgressAggregator::apply(const WorkerEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::visit([this](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        auto& worker = m_snapshot.perWorker[e.workerIndex];

        if constexpr (std::is_same_v<T, WorkerStarted>) {
            worker.state = WorkerState::Running;
            worker.itemsTotal = e.itemsAssigned;
        }
        else if constexpr (std::is_same_v<T, ItemStarted>) {
            worker.currentItem = e.item.relativePath;
            worker.bytesInFlight = 0;
            worker.rate.clear();
        }
        else if constexpr (std::is_same_v<T, ItemProgress>) {
            worker.bytesInFlight = std::min(e.bytesTransferred, e.item.sizeBytes);
            worker.rate = e.rate;
        }
        else if constexpr (std::is_same_v<T, ItemCompleted>) {
            worker.itemsDone += 1;
            worker.currentItem.clear();
            worker.bytesInFlight = 0;
            m_snapshot.filesDone = std::min(m_snapshot.totalFiles, m_snapshot.filesDone + e.item.fileCount);
            m_snapshot.bytesDone = std::min(m_snapshot.totalBytes, m_snapshot.bytesDone + e.item.sizeBytes);
        }
        else if constexpr (std::is_same_v<T, ItemFailed>) {
            worker.itemsDone += 1;
            worker.currentItem.clear();
            worker.bytesInFlight = 0;
            auto idx = static_cast<std::size_t>(e.workerIndex);
            if (idx < m_workerFailed.size()) m_workerFailed[idx] = true;
        }
        else if constexpr (std::is_same_v<T, WorkerFinished>) {
            worker.currentItem.clear();
            worker.bytesInFlight = 0;
            auto idx = static_cast<std::size_t>(e.workerIndex);
            bool failed = idx < m_workerFailed.size() && m_workerFailed[idx];
            if (e.cancelled) {
                worker.state = WorkerState::Cancelled;
            } else {
                worker.state = failed ? WorkerState::Failed : WorkerState::Completed;
            }
        }
    }, event);

    recountActive();
}

void ProgressAggregator::recountActive() {
    m_snapshot.activeWorkers = static_cast<int>(std::count_if(
        m_snapshot.perWorker.begin(), m_snapshot.perWorker.end(),
        [](const auto& kv) { return kv.second.state == WorkerState::Running; }));
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

} // namespace parasync::application::sync
