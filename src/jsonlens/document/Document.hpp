#pragma once
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "document/NodeKind.hpp"
#include "path/Path.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace JL {

// Borrowed reference into a Document; null when the path does not resolve.
using ElementRef = Json const*;

/**
 * Document: decoded JSON input, immutable for the lifetime of a session.
 *
 * The whole input is decoded once into a random-access element tree. The tree
 * view on top of it (LazyNode) is what gets materialized on demand, never the
 * parse itself. A Document is shared read-only between the loader, the
 * analyzer and the serializer through shared_ptr<Document const>.
 *
 * Failure modes of parse/load:
 *  - SizeExceeded: input larger than ParseConfig::maxBytes, reported before any
 *    decoding starts (for files, before the file is read).
 *  - DepthExceeded: nesting deeper than ParseConfig::maxDepth.
 *  - MalformedInput: syntax error, with the byte offset reported by the parser.
 *  - IoError: the file cannot be read.
 *  - Cancelled: the token fired while decoding.
 */
class Document {
public:
    static auto parse(std::string_view bytes,
                      ParseConfig const& config = {},
                      CancellationToken const& token = {},
                      std::string sourceName = {}) -> Expected<std::shared_ptr<Document const>>;

    static auto load(std::filesystem::path const& file,
                     ParseConfig const& config = {},
                     CancellationToken const& token = {}) -> Expected<std::shared_ptr<Document const>>;

    Document(Document const&)                    = delete;
    auto operator=(Document const&) -> Document& = delete;

    [[nodiscard]] auto root() const -> Json const& { return this->root_; }
    // Structural navigation from the root; never fails, returns null instead.
    [[nodiscard]] auto resolve(Path const& path) const -> ElementRef;

    [[nodiscard]] auto byteSize() const -> std::uint64_t { return this->byteSize_; }
    [[nodiscard]] auto sourceName() const -> std::string const& { return this->sourceName_; }

private:
    Document(Json root, std::uint64_t byteSize, std::string sourceName);

    Json          root_;
    std::uint64_t byteSize_ = 0;
    std::string   sourceName_;
};

} // namespace JL
