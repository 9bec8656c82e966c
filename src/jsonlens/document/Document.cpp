#include "Document.hpp"
#include "log/TaggedLogger.hpp"

#include <fstream>
#include <system_error>

namespace JL {

namespace {

// Thrown from the parser callback to abort decoding; never escapes parse().
struct DepthLimitReached {
    int depth;
};
struct ParseCancelled {
    Error error;
};

constexpr std::uint64_t CancellationCheckInterval = 1u << 14;

auto sizeError(std::uint64_t size, std::uint64_t limit) -> Error {
    return Error{Error::Code::SizeExceeded,
                 "input is " + std::to_string(size) + " bytes, limit is " + std::to_string(limit) + " bytes"};
}

} // namespace

Document::Document(Json root, std::uint64_t byteSize, std::string sourceName)
    : root_(std::move(root)), byteSize_(byteSize), sourceName_(std::move(sourceName)) {}

auto Document::parse(std::string_view bytes, ParseConfig const& config, CancellationToken const& token, std::string sourceName)
        -> Expected<std::shared_ptr<Document const>> {
    if (bytes.size() > config.maxBytes) {
        jl_log("Document::parse rejected oversized input: " + std::to_string(bytes.size()) + " bytes", "Document", "Warning");
        return std::unexpected(sizeError(bytes.size(), config.maxBytes));
    }
    if (auto error = token.check())
        return std::unexpected(std::move(*error));

    jl_log("Document::parse start: " + std::to_string(bytes.size()) + " bytes", "Document");

    std::uint64_t events   = 0;
    int const     maxDepth = static_cast<int>(config.maxDepth);
    Json::parser_callback_t guard = [&](int depth, Json::parse_event_t event, Json&) -> bool {
        // depth counts the containers enclosing the one being opened, so the root opens at 0.
        if ((event == Json::parse_event_t::object_start || event == Json::parse_event_t::array_start) && depth >= maxDepth)
            throw DepthLimitReached{depth + 1};
        if ((++events % CancellationCheckInterval) == 0) {
            if (auto error = token.check())
                throw ParseCancelled{std::move(*error)};
        }
        return true;
    };

    try {
        auto root = Json::parse(bytes, guard, true, config.allowComments);
        jl_log("Document::parse done", "Document");
        return std::shared_ptr<Document const>(new Document(std::move(root), bytes.size(), std::move(sourceName)));
    } catch (DepthLimitReached const& reached) {
        jl_log("Document::parse depth limit reached", "Document", "Warning");
        return std::unexpected(Error{Error::Code::DepthExceeded,
                                     "nesting depth " + std::to_string(reached.depth) + " exceeds limit "
                                             + std::to_string(config.maxDepth)});
    } catch (ParseCancelled& cancelled) {
        jl_log("Document::parse cancelled", "Document");
        return std::unexpected(std::move(cancelled.error));
    } catch (Json::parse_error const& error) {
        jl_log(std::string{"Document::parse malformed input: "} + error.what(), "Document", "Warning");
        return std::unexpected(Error{Error::Code::MalformedInput, error.what(), error.byte});
    } catch (Json::exception const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, error.what()});
    }
}

auto Document::load(std::filesystem::path const& file, ParseConfig const& config, CancellationToken const& token)
        -> Expected<std::shared_ptr<Document const>> {
    std::error_code ec;
    auto const      size = std::filesystem::file_size(file, ec);
    if (ec) {
        jl_log("Document::load cannot stat " + file.string() + ": " + ec.message(), "Document", "Error");
        return std::unexpected(Error{Error::Code::IoError, "cannot read " + file.string() + ": " + ec.message()});
    }
    if (size > config.maxBytes)
        return std::unexpected(sizeError(size, config.maxBytes));

    std::ifstream stream(file, std::ios::binary);
    if (!stream)
        return std::unexpected(Error{Error::Code::IoError, "cannot open " + file.string()});

    std::string bytes;
    bytes.resize(static_cast<std::size_t>(size));
    if (size > 0 && !stream.read(bytes.data(), static_cast<std::streamsize>(size)))
        return std::unexpected(Error{Error::Code::IoError, "short read from " + file.string()});

    return parse(bytes, config, token, file.string());
}

auto Document::resolve(Path const& path) const -> ElementRef {
    Json const* current = &this->root_;
    for (auto const& segment : path.segments()) {
        if (segment.isIndex()) {
            if (!current->is_array() || segment.index() >= current->size())
                return nullptr;
            current = &(*current)[segment.index()];
        } else {
            if (!current->is_object())
                return nullptr;
            auto it = current->find(segment.name());
            if (it == current->end())
                return nullptr;
            current = &*it;
        }
    }
    return current;
}

} // namespace JL
