#pragma once
#include "core/Error.hpp"
#include "memory/MemoryLevel.hpp"
#include "path/Path.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace JL {

enum class EventKind {
    NodeUpdated,        // node state changed (expanded, collapsed, load started)
    ChildrenBatch,      // a batch of children was attached to path; count = batch size
    ChildrenLoaded,     // load finished; count = attached children
    LoadFailed,         // load of path failed; error set
    NodeEvicted,        // children of path were dropped; count = released nodes
    MemoryStatus,       // one per monitor sample
    MemoryLevelChanged, // level differs from the previous sample
    IndexRebuilt        // count = indexed entries
};

constexpr std::string_view eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::NodeUpdated:
            return "NodeUpdated";
        case EventKind::ChildrenBatch:
            return "ChildrenBatch";
        case EventKind::ChildrenLoaded:
            return "ChildrenLoaded";
        case EventKind::LoadFailed:
            return "LoadFailed";
        case EventKind::NodeEvicted:
            return "NodeEvicted";
        case EventKind::MemoryStatus:
            return "MemoryStatus";
        case EventKind::MemoryLevelChanged:
            return "MemoryLevelChanged";
        case EventKind::IndexRebuilt:
            return "IndexRebuilt";
    }
    return "Unknown";
}

// Coarse-grained change notification. Fields beyond kind are filled per kind as noted above.
struct Event {
    EventKind                             kind;
    Path                                  path;
    std::size_t                           count = 0;
    std::optional<Error>                  error;
    MemoryLevel                           level         = MemoryLevel::Normal;
    std::uint64_t                         residentBytes = 0;
    std::chrono::steady_clock::time_point time          = std::chrono::steady_clock::now();
};

} // namespace JL
