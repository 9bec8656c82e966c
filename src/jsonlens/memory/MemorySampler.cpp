#include "MemorySampler.hpp"
#include "log/TaggedLogger.hpp"

#include <fstream>

#include <unistd.h>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace JL {

ProcessMemorySampler::ProcessMemorySampler(std::filesystem::path statm)
    : statm(std::move(statm)) {}

auto ProcessMemorySampler::residentBytes() -> Expected<std::uint64_t> {
    std::ifstream stream(this->statm);
    if (!stream)
        return std::unexpected(Error{Error::Code::NotSupported, "cannot open " + this->statm.string()});

    // statm: size resident shared text lib data dt, all in pages.
    std::uint64_t sizePages     = 0;
    std::uint64_t residentPages = 0;
    if (!(stream >> sizePages >> residentPages))
        return std::unexpected(Error{Error::Code::IoError, "unexpected format in " + this->statm.string()});

    auto const pageSize = ::sysconf(_SC_PAGESIZE);
    if (pageSize <= 0)
        return std::unexpected(Error{Error::Code::NotSupported, "page size unavailable"});
    return residentPages * static_cast<std::uint64_t>(pageSize);
}

auto releaseFreeMemory() -> void {
#if defined(__GLIBC__)
    ::malloc_trim(0);
    jl_log("releaseFreeMemory: malloc_trim done", "Memory");
#endif
}

} // namespace JL
