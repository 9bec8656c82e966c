#pragma once
#include "path/Path.hpp"
#include "tree/LazyNode.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace JL {

/**
 * Best-effort path -> node lookup cache.
 *
 * The tree is authoritative: entries are weak, so an evicted subtree simply
 * leaves expired entries behind until purgeExpired() or a lookup drops them.
 * A node that is still referenced elsewhere outlives its eviction, so whoever
 * evicts also calls removeDescendants() for the evicted paths.
 * The map uses phmap::parallel_flat_hash_map with internal sharding, so
 * lookups from the UI thread and purges from the monitor do not contend on a
 * single lock.
 */
class NodeCache {
public:
    static constexpr int         DefaultSubmaps   = 4;
    static constexpr std::size_t PurgeBatchSize   = 50;

    using Map = phmap::parallel_flat_hash_map<
            Path,
            std::weak_ptr<LazyNode>,
            PathHash,
            std::equal_to<Path>,
            std::allocator<std::pair<const Path, std::weak_ptr<LazyNode>>>,
            DefaultSubmaps,
            std::mutex>;

    explicit NodeCache(std::size_t capacity = 100'000);

    // Returns false when the cache is full of live entries.
    auto put(std::shared_ptr<LazyNode> const& node) -> bool;
    auto get(Path const& path) -> std::shared_ptr<LazyNode>;
    auto remove(Path const& path) -> bool;
    // Drops every entry strictly below one of the given paths; returns how many were dropped.
    auto removeDescendants(std::vector<Path> const& roots) -> std::size_t;
    // Drops expired entries in batches of PurgeBatchSize; returns how many were dropped.
    auto purgeExpired() -> std::size_t;
    auto clear() -> void;

    [[nodiscard]] auto size() const -> std::size_t { return this->map.size(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return this->capacity_; }
    [[nodiscard]] auto hits() const -> std::uint64_t { return this->hits_.load(); }
    [[nodiscard]] auto misses() const -> std::uint64_t { return this->misses_.load(); }
    [[nodiscard]] auto hitRate() const -> double;

private:
    std::size_t                capacity_;
    Map                        map;
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
};

} // namespace JL
