#include "NodeCache.hpp"
#include "log/TaggedLogger.hpp"

#include <vector>

namespace JL {

NodeCache::NodeCache(std::size_t capacity)
    : capacity_(capacity) {}

auto NodeCache::put(std::shared_ptr<LazyNode> const& node) -> bool {
    if (!node)
        return false;
    if (this->map.size() >= this->capacity_ && !this->map.contains(node->path())) {
        this->purgeExpired();
        if (this->map.size() >= this->capacity_)
            return false;
    }
    this->map.insert_or_assign(node->path(), std::weak_ptr<LazyNode>(node));
    return true;
}

auto NodeCache::get(Path const& path) -> std::shared_ptr<LazyNode> {
    std::shared_ptr<LazyNode> node;
    bool                      expired = false;
    this->map.if_contains(path, [&](auto const& entry) {
        node    = entry.second.lock();
        expired = !node;
    });
    if (expired)
        this->map.erase_if(path, [](auto& entry) { return entry.second.expired(); });
    if (node)
        ++this->hits_;
    else
        ++this->misses_;
    return node;
}

auto NodeCache::remove(Path const& path) -> bool {
    return this->map.erase(path) > 0;
}

auto NodeCache::removeDescendants(std::vector<Path> const& roots) -> std::size_t {
    if (roots.empty() || this->map.empty())
        return 0;
    phmap::flat_hash_set<Path, PathHash> evicted(roots.begin(), roots.end());
    std::vector<Path>                    stale;
    this->map.for_each([&](auto const& entry) {
        auto ancestor = entry.first.parent();
        while (ancestor) {
            if (evicted.contains(*ancestor)) {
                stale.push_back(entry.first);
                return;
            }
            ancestor = ancestor->parent();
        }
    });
    std::size_t removed = 0;
    for (auto const& path : stale)
        removed += this->map.erase(path);
    return removed;
}

auto NodeCache::purgeExpired() -> std::size_t {
    std::size_t removed = 0;
    while (true) {
        std::vector<Path> batch;
        batch.reserve(PurgeBatchSize);
        this->map.for_each([&batch](auto const& entry) {
            if (batch.size() < PurgeBatchSize && entry.second.expired())
                batch.push_back(entry.first);
        });
        for (auto const& path : batch) {
            if (this->map.erase_if(path, [](auto& entry) { return entry.second.expired(); }))
                ++removed;
        }
        if (batch.size() < PurgeBatchSize)
            break;
    }
    if (removed > 0)
        jl_log("NodeCache::purgeExpired removed " + std::to_string(removed) + " entries", "Memory");
    return removed;
}

auto NodeCache::clear() -> void {
    this->map.clear();
}

auto NodeCache::hitRate() const -> double {
    auto const total = this->hits_.load() + this->misses_.load();
    return total > 0 ? static_cast<double>(this->hits_.load()) / static_cast<double>(total) : 0.0;
}

} // namespace JL
