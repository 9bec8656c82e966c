#pragma once
#include <string_view>

namespace JL {

enum class MemoryLevel {
    Normal,  // at or below the warning threshold
    Warning, // above the warning threshold
    Critical // above the critical threshold
};

constexpr std::string_view memoryLevelToString(MemoryLevel level) {
    switch (level) {
        case MemoryLevel::Normal:
            return "Normal";
        case MemoryLevel::Warning:
            return "Warning";
        case MemoryLevel::Critical:
            return "Critical";
    }
    return "Unknown";
}

} // namespace JL
