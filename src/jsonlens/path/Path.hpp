#pragma once
#include "core/Error.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace JL {

/**
 * One step of a Path: either an object property name or an array index.
 */
struct PathSegment {
    PathSegment() = default;
    PathSegment(std::string name)
        : value(std::move(name)) {}
    PathSegment(char const* name)
        : value(std::string{name}) {}
    PathSegment(std::size_t index)
        : value(index) {}

    [[nodiscard]] auto isIndex() const -> bool { return std::holds_alternative<std::size_t>(this->value); }
    [[nodiscard]] auto isName() const -> bool { return std::holds_alternative<std::string>(this->value); }
    [[nodiscard]] auto name() const -> std::string const& { return std::get<std::string>(this->value); }
    [[nodiscard]] auto index() const -> std::size_t { return std::get<std::size_t>(this->value); }

    // Display key of the node this segment leads to: the property name, or "[i]".
    [[nodiscard]] auto label() const -> std::string;

    auto operator==(PathSegment const& other) const -> bool = default;
    auto operator<=>(PathSegment const& other) const -> std::strong_ordering;

    std::variant<std::string, std::size_t> value;
};

/**
 * Path: canonical identity of a node in the document.
 *
 * The empty path is the root. Paths are used as node identifiers for the load
 * coordinator, as eviction keys and as search index keys; two paths are equal
 * iff their segment sequences are equal.
 *
 * Text form is a JSONPath-like expression: $, $.name, $[3], $['not an identifier'].
 */
class Path {
public:
    Path() = default;
    explicit Path(std::vector<PathSegment> segments);

    static auto Root() -> Path { return Path{}; }
    static auto parse(std::string_view text) -> Expected<Path>;

    [[nodiscard]] auto child(std::string name) const -> Path;
    [[nodiscard]] auto child(char const* name) const -> Path;
    [[nodiscard]] auto child(std::size_t index) const -> Path;
    [[nodiscard]] auto child(PathSegment segment) const -> Path;
    [[nodiscard]] auto parent() const -> std::optional<Path>;

    [[nodiscard]] auto isRoot() const -> bool { return this->segments_.empty(); }
    [[nodiscard]] auto depth() const -> std::size_t { return this->segments_.size(); }
    [[nodiscard]] auto segments() const -> std::vector<PathSegment> const& { return this->segments_; }
    [[nodiscard]] auto back() const -> PathSegment const& { return this->segments_.back(); }

    // Ancestor-or-self test.
    [[nodiscard]] auto isPrefixOf(Path const& other) const -> bool;

    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(Path const& other) const -> bool = default;
    auto operator<=>(Path const& other) const -> std::strong_ordering;

private:
    std::vector<PathSegment> segments_;
};

struct PathHash {
    auto operator()(Path const& path) const noexcept -> std::size_t;
};

// True when the name can be written as $.name without quoting.
auto isPlainIdentifier(std::string_view name) -> bool;

} // namespace JL
