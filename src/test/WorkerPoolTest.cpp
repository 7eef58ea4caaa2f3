#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "application/sync/Batcher.hpp"
#include "application/sync/WorkerPool.hpp"
#include "test/FakeCopyExecutor.hpp"

using namespace parasync::domain::sync;
using namespace parasync::application::sync;

namespace {

struct Recorded {
    std::string type;
    std::string item;
    std::string message;
    bool cancelled = false;
};

class EventLog {
public:
    void record(const WorkerEvent& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::visit([this](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            Recorded r;
            r.type = T::Type;
            if constexpr (std::is_same_v<T, ItemStarted> || std::is_same_v<T, ItemProgress> ||
                          std::is_same_v<T, ItemCompleted> || std::is_same_v<T, ItemFailed>) {
                r.item = e.item.relativePath;
            }
            if constexpr (std::is_same_v<T, ItemFailed>) {
                r.message = e.message;
            }
            if constexpr (std::is_same_v<T, WorkerFinished>) {
                r.cancelled = e.cancelled;
            }
            m_byWorker[e.workerIndex].push_back(r);
        }, event);
    }

    std::map<int, std::vector<Recorded>> byWorker() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_byWorker;
    }

    std::size_t count(const std::string& type) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t n = 0;
        for (const auto& [w, events] : m_byWorker) {
            for (const auto& e : events) n += e.type == type;
        }
        return n;
    }

private:
    std::mutex m_mutex;
    std::map<int, std::vector<Recorded>> m_byWorker;
};

std::vector<Item> MakeItems(int n) {
    std::vector<Item> items;
    for (int i = 0; i < n; ++i) {
        items.push_back(Item{"item" + std::to_string(i), static_cast<std::uint64_t>(100 + i), 1, false});
    }
    return items;
}

CopyOptions Options() {
    return CopyOptions{"/src", "/dst", {"-a"}, {}};
}

void TestEventOrderAndFailureIsolation() {
    auto fake = std::make_shared<FakeCopyExecutor>();
    fake->failing = {"item3"};
    WorkerPool pool(std::make_shared<ItemExecutor>(fake, std::chrono::milliseconds(0)));

    auto assignments = Batcher::assign(MakeItems(9), 3);
    RunControl control;
    EventLog log;
    pool.run("job", assignments, Options(), control, [&log](const WorkerEvent& e) { log.record(e); });

    auto byWorker = log.byWorker();
    assert(byWorker.size() == 3);
    for (const auto& assignment : assignments) {
        const auto& events = byWorker.at(assignment.workerIndex);
        assert(events.front().type == std::string(WorkerStarted::Type));
        assert(events.back().type == std::string(WorkerFinished::Type));
        assert(!events.back().cancelled);

        // Items are processed strictly in assignment order: Started, Progress*, Completed|Failed.
        std::size_t pos = 1;
        for (const auto& item : assignment.items) {
            assert(events[pos].type == std::string(ItemStarted::Type) && events[pos].item == item.relativePath);
            ++pos;
            while (events[pos].type == std::string(ItemProgress::Type)) ++pos;
            const bool shouldFail = item.relativePath == "item3";
            assert(events[pos].type == std::string(shouldFail ? ItemFailed::Type : ItemCompleted::Type));
            assert(events[pos].item == item.relativePath);
            ++pos;
        }
        assert(pos == events.size() - 1);
    }
    assert(log.count(ItemFailed::Type) == 1);
    assert(log.count(ItemCompleted::Type) == 8);
    std::cout << "[PASS] Event order and failure isolation." << std::endl;
}

void TestWorkersRunConcurrently() {
    auto fake = std::make_shared<FakeCopyExecutor>();
    fake->holdUntilReleased = true;
    WorkerPool pool(std::make_shared<ItemExecutor>(fake));

    auto assignments = Batcher::assign(MakeItems(8), 4);
    RunControl control;
    EventLog log;
    std::thread runner([&]() {
        pool.run("job", assignments, Options(), control, [&log](const WorkerEvent& e) { log.record(e); });
    });

    // All four lanes hold an item at the same time.
    assert(fake->waitForStarted(4));
    assert(fake->maxInFlight() == 4);
    fake->release();
    runner.join();

    assert(fake->finished().size() == 8);
    assert(fake->maxInFlight() <= 4);
    std::cout << "[PASS] One lane per worker." << std::endl;
}

void TestCancelStopsInFlight() {
    auto fake = std::make_shared<FakeCopyExecutor>();
    fake->holdUntilReleased = true;
    WorkerPool pool(std::make_shared<ItemExecutor>(fake));

    auto assignments = Batcher::assign(MakeItems(6), 2);
    RunControl control;
    EventLog log;
    std::thread runner([&]() {
        pool.run("job", assignments, Options(), control, [&log](const WorkerEvent& e) { log.record(e); });
    });

    // Never released: only the cancel can end the two held copies.
    assert(fake->waitForStarted(2));
    control.cancel();
    runner.join();

    assert(fake->started().size() == 2);
    assert(fake->finished().size() == 2);
    assert(log.count(ItemCompleted::Type) == 0);
    assert(log.count(ItemFailed::Type) == 2);
    for (const auto& [w, events] : log.byWorker()) {
        assert(events.back().type == std::string(WorkerFinished::Type));
        assert(events.back().cancelled);
        const auto& failed = events[events.size() - 2];
        assert(failed.type == std::string(ItemFailed::Type));
        assert(failed.message.find("stopped by cancel") != std::string::npos);
    }
    std::cout << "[PASS] Cancel stops in-flight copies." << std::endl;
}

void TestCancelWhileToolIgnoresStop() {
    auto fake = std::make_shared<FakeCopyExecutor>();
    fake->holdUntilReleased = true;
    fake->ignoreStop = true;
    WorkerPool pool(std::make_shared<ItemExecutor>(fake));

    auto assignments = Batcher::assign(MakeItems(6), 2);
    RunControl control;
    EventLog log;
    std::thread runner([&]() {
        pool.run("job", assignments, Options(), control, [&log](const WorkerEvent& e) { log.record(e); });
    });

    assert(fake->waitForStarted(2));
    control.cancel();
    fake->release();
    runner.join();

    // Copies that finish anyway count as done; nothing further is dispatched.
    assert(fake->started().size() == 2);
    assert(log.count(ItemCompleted::Type) == 2);
    assert(log.count(ItemFailed::Type) == 0);
    for (const auto& [w, events] : log.byWorker()) {
        assert(events.back().cancelled);
    }
    std::cout << "[PASS] No dispatch after cancel." << std::endl;
}

void TestPauseHoldsDispatch() {
    auto fake = std::make_shared<FakeCopyExecutor>();
    WorkerPool pool(std::make_shared<ItemExecutor>(fake));

    auto assignments = Batcher::assign(MakeItems(4), 2);
    RunControl control;
    control.pause();
    EventLog log;
    std::thread runner([&]() {
        pool.run("job", assignments, Options(), control, [&log](const WorkerEvent& e) { log.record(e); });
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(fake->started().empty());
    assert(control.isPaused());

    control.resume();
    runner.join();
    assert(fake->finished().size() == 4);
    std::cout << "[PASS] Pause holds dispatch until resume." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WorkerPool Test..." << std::endl;
    TestEventOrderAndFailureIsolation();
    TestWorkersRunConcurrently();
    TestCancelStopsInFlight();
    TestCancelWhileToolIgnoresStop();
    TestPauseHoldsDispatch();
    std::cout << "[PASS] WorkerPool Test." << std::endl;
    return 0;
}
