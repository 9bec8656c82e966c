#pragma once
#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "document/Document.hpp"
#include "tree/LazyNode.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace JL {

struct MaterializeOptions {
    std::size_t offset        = 0;
    std::size_t limit         = 1000;
    std::size_t batchSize     = 500;
    std::size_t previewLength = 100;
};

struct MaterializeResult {
    LazyNode::Children children;
    std::size_t        totalCount = 0; // true cardinality of the element
    std::size_t        offset     = 0;
    bool               partial    = false; // children remain past offset + children.size()
};

// Called with each batch right after it is produced, before the next batch starts.
using BatchCallback = std::function<void(LazyNode::Children const& batch)>;

/**
 * Produces the immediate children of the element at path, in source order.
 *
 * Grandchildren are never touched: each produced child only records its own
 * declared child count, which makes a call O(produced children) regardless of
 * subtree size. At most options.limit children are produced starting at
 * options.offset. Cancellation is checked before every batch.
 *
 * Errors: NoSuchPath when path does not resolve, Cancelled/Timeout from token.
 */
auto materializeChildren(Document const& document,
                         Path const& path,
                         MaterializeOptions const& options = {},
                         CancellationToken const& token    = {},
                         BatchCallback const& onBatch      = {}) -> Expected<MaterializeResult>;

// Preview text: strings quoted and truncated to previewLength with "...", scalars as JSON text,
// containers as "{ N items }", "[ N items ]", "{}" or "[]".
auto displayValue(Json const& element, std::size_t previewLength = 100) -> std::string;

auto makeNode(Json const& element, Path path, std::size_t previewLength = 100) -> std::shared_ptr<LazyNode>;

// Root node, keyed "root" at the empty path.
auto makeRootNode(Document const& document, std::size_t previewLength = 100) -> std::shared_ptr<LazyNode>;

} // namespace JL
