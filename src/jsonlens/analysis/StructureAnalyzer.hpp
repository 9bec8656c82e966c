#pragma once
#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "document/Document.hpp"

#include <cstdint>
#include <string>

namespace JL {

struct StructureInfo {
    std::uint64_t totalNodes    = 0;
    std::uint64_t objectCount   = 0;
    std::uint64_t arrayCount    = 0;
    std::uint64_t stringCount   = 0;
    std::uint64_t numberCount   = 0;
    std::uint64_t booleanCount  = 0;
    std::uint64_t nullCount     = 0;
    std::uint64_t propertyCount = 0;
    std::uint64_t arrayItemCount = 0;
    std::uint64_t maxArrayLength = 0;
    std::uint64_t totalStringLength = 0;
    std::uint64_t maxStringLength   = 0;
    std::uint64_t maxDepth = 0;
    std::uint64_t byteSize = 0;

    [[nodiscard]] auto summary() const -> std::string;
};

// Single depth-first pass; a cancelled run reports Cancelled, never partial counters.
auto analyze(Document const& document, CancellationToken const& token = {}) -> Expected<StructureInfo>;

} // namespace JL
