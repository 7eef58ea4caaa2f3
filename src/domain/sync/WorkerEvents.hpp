/**
 * @file WorkerEvents.hpp
 * @brief Events emitted by worker lanes while executing their assignments.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "domain/sync/Item.hpp"

namespace parasync::domain::sync {

struct WorkerStarted {
    static constexpr const char* Type = "WorkerStarted";
    int workerIndex;
    std::size_t itemsAssigned;
};

struct ItemStarted {
    static constexpr const char* Type = "ItemStarted";
    int workerIndex;
    Item item;
};

struct ItemProgress {
    static constexpr const char* Type = "ItemProgress";
    int workerIndex;
    Item item;
    std::uint64_t bytesTransferred; // within this item
    std::string rate;               // as printed by the tool, e.g. "12.34MB/s"
};

struct ItemCompleted {
    static constexpr const char* Type = "ItemCompleted";
    int workerIndex;
    Item item;
};

struct ItemFailed {
    static constexpr const char* Type = "ItemFailed";
    int workerIndex;
    Item item;
    std::string message;
};

struct WorkerFinished {
    static constexpr const char* Type = "WorkerFinished";
    int workerIndex;
    bool cancelled;
};

using WorkerEvent = std::variant<
    WorkerStarted,
    ItemStarted,
    ItemProgress,
    ItemCompleted,
    ItemFailed,
    WorkerFinished
>;

} // namespace parasync::domain::sync
