#include "Path.hpp"

#include <algorithm>
#include <charconv>

namespace JL {

namespace {

auto isIdentifierStart(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_' || ch == '$';
}

auto isIdentifierChar(char ch) -> bool {
    return isIdentifierStart(ch) || (ch >= '0' && ch <= '9');
}

auto appendQuoted(std::string& out, std::string const& name) -> void {
    out.append("['");
    for (char ch : name) {
        if (ch == '\'' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.append("']");
}

auto invalid(std::string_view text, std::string_view why) -> Error {
    std::string message{why};
    message.append(" in '");
    message.append(text.data(), text.size());
    message.push_back('\'');
    return Error{Error::Code::InvalidPath, std::move(message)};
}

} // namespace

auto PathSegment::label() const -> std::string {
    if (this->isIndex())
        return "[" + std::to_string(this->index()) + "]";
    return this->name();
}

auto PathSegment::operator<=>(PathSegment const& other) const -> std::strong_ordering {
    // Indices sort before names; within a kind, natural order.
    if (this->isIndex() != other.isIndex())
        return this->isIndex() ? std::strong_ordering::less : std::strong_ordering::greater;
    if (this->isIndex())
        return this->index() <=> other.index();
    return this->name().compare(other.name()) <=> 0;
}

Path::Path(std::vector<PathSegment> segments)
    : segments_(std::move(segments)) {}

auto Path::child(std::string name) const -> Path {
    return this->child(PathSegment{std::move(name)});
}

auto Path::child(char const* name) const -> Path {
    return this->child(PathSegment{name});
}

auto Path::child(std::size_t index) const -> Path {
    return this->child(PathSegment{index});
}

auto Path::child(PathSegment segment) const -> Path {
    Path result{*this};
    result.segments_.push_back(std::move(segment));
    return result;
}

auto Path::parent() const -> std::optional<Path> {
    if (this->segments_.empty())
        return std::nullopt;
    return Path{std::vector<PathSegment>(this->segments_.begin(), this->segments_.end() - 1)};
}

auto Path::isPrefixOf(Path const& other) const -> bool {
    if (this->segments_.size() > other.segments_.size())
        return false;
    for (std::size_t i = 0; i < this->segments_.size(); ++i) {
        if (!(this->segments_[i] == other.segments_[i]))
            return false;
    }
    return true;
}

auto Path::toString() const -> std::string {
    std::string out{"$"};
    for (auto const& segment : this->segments_) {
        if (segment.isIndex()) {
            out.push_back('[');
            out.append(std::to_string(segment.index()));
            out.push_back(']');
        } else if (isPlainIdentifier(segment.name())) {
            out.push_back('.');
            out.append(segment.name());
        } else {
            appendQuoted(out, segment.name());
        }
    }
    return out;
}

auto Path::operator<=>(Path const& other) const -> std::strong_ordering {
    return std::lexicographical_compare_three_way(this->segments_.begin(), this->segments_.end(),
                                                  other.segments_.begin(), other.segments_.end());
}

auto Path::parse(std::string_view text) -> Expected<Path> {
    if (text.empty() || text.front() != '$')
        return std::unexpected(invalid(text, "path must start with '$'"));

    std::vector<PathSegment> segments;
    std::size_t              pos = 1;
    while (pos < text.size()) {
        char const ch = text[pos];
        if (ch == '.') {
            auto const start = ++pos;
            while (pos < text.size() && isIdentifierChar(text[pos]))
                ++pos;
            if (pos == start || !isIdentifierStart(text[start]))
                return std::unexpected(invalid(text, "expected a property name after '.'"));
            segments.emplace_back(std::string{text.substr(start, pos - start)});
        } else if (ch == '[') {
            ++pos;
            if (pos >= text.size())
                return std::unexpected(invalid(text, "unterminated '['"));
            if (text[pos] == '\'' || text[pos] == '"') {
                char const  quote = text[pos++];
                std::string name;
                bool        closed = false;
                while (pos < text.size()) {
                    char const c = text[pos++];
                    if (c == '\\' && pos < text.size()) {
                        name.push_back(text[pos++]);
                    } else if (c == quote) {
                        closed = true;
                        break;
                    } else {
                        name.push_back(c);
                    }
                }
                if (!closed || pos >= text.size() || text[pos] != ']')
                    return std::unexpected(invalid(text, "unterminated quoted name"));
                ++pos;
                segments.emplace_back(std::move(name));
            } else {
                auto const  start = pos;
                std::size_t index = 0;
                auto const  result = std::from_chars(text.data() + start, text.data() + text.size(), index);
                if (result.ec != std::errc{} || result.ptr == text.data() + start)
                    return std::unexpected(invalid(text, "expected an array index"));
                pos = static_cast<std::size_t>(result.ptr - text.data());
                if (pos >= text.size() || text[pos] != ']')
                    return std::unexpected(invalid(text, "expected ']'"));
                ++pos;
                segments.emplace_back(index);
            }
        } else {
            return std::unexpected(invalid(text, "unexpected character"));
        }
    }
    return Path{std::move(segments)};
}

auto PathHash::operator()(Path const& path) const noexcept -> std::size_t {
    std::size_t seed = 0x9e3779b97f4a7c15ULL;
    for (auto const& segment : path.segments()) {
        std::size_t const h = segment.isIndex() ? std::hash<std::size_t>{}(segment.index()) * 31u + 1u
                                                : std::hash<std::string>{}(segment.name());
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto isPlainIdentifier(std::string_view name) -> bool {
    if (name.empty() || !isIdentifierStart(name.front()))
        return false;
    for (char ch : name) {
        if (!isIdentifierChar(ch))
            return false;
    }
    return true;
}

} // namespace JL
