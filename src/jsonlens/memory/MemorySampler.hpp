#pragma once
#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>

namespace JL {

// Source of resident memory readings for the monitor.
struct MemorySampler {
    virtual ~MemorySampler() = default;

    virtual auto residentBytes() -> Expected<std::uint64_t> = 0;
};

// Resident set size of the current process, from /proc/self/statm.
class ProcessMemorySampler : public MemorySampler {
public:
    explicit ProcessMemorySampler(std::filesystem::path statm = "/proc/self/statm");

    auto residentBytes() -> Expected<std::uint64_t> override;

private:
    std::filesystem::path statm;
};

// Returns free heap pages to the OS where the C library supports it.
auto releaseFreeMemory() -> void;

} // namespace JL
