#include "TreeMaterializer.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace JL {

namespace {

// Cut position that does not split a UTF-8 sequence.
auto utf8Boundary(std::string const& text, std::size_t position) -> std::size_t {
    while (position > 0 && (static_cast<unsigned char>(text[position]) & 0xC0u) == 0x80u)
        --position;
    return position;
}

auto containerSummary(char open, char close, std::size_t count) -> std::string {
    if (count == 0)
        return std::string{open} + close;
    return std::string{open} + " " + std::to_string(count) + " items " + close;
}

} // namespace

auto displayValue(Json const& element, std::size_t previewLength) -> std::string {
    switch (kindOf(element)) {
        case NodeKind::Object:
            return containerSummary('{', '}', element.size());
        case NodeKind::Array:
            return containerSummary('[', ']', element.size());
        case NodeKind::String: {
            auto const& text = element.get_ref<Json::string_t const&>();
            if (text.size() <= previewLength)
                return '"' + text + '"';
            return '"' + text.substr(0, utf8Boundary(text, previewLength)) + "...\"";
        }
        case NodeKind::Number:
        case NodeKind::Boolean:
        case NodeKind::Null:
            return element.dump();
    }
    return {};
}

auto makeNode(Json const& element, Path path, std::size_t previewLength) -> std::shared_ptr<LazyNode> {
    auto const kind = kindOf(element);
    std::string key = path.isRoot() ? std::string{"root"} : path.back().label();
    return std::make_shared<LazyNode>(std::move(path),
                                      std::move(key),
                                      kind,
                                      displayValue(element, previewLength),
                                      childCountOf(element),
                                      isContainer(kind) ? Json{} : element);
}

auto makeRootNode(Document const& document, std::size_t previewLength) -> std::shared_ptr<LazyNode> {
    return makeNode(document.root(), Path::Root(), previewLength);
}

auto materializeChildren(Document const& document,
                         Path const& path,
                         MaterializeOptions const& options,
                         CancellationToken const& token,
                         BatchCallback const& onBatch) -> Expected<MaterializeResult> {
    auto const element = document.resolve(path);
    if (element == nullptr) {
        jl_log("materializeChildren: path does not resolve: " + path.toString(), "Loader", "Warning");
        return std::unexpected(Error{Error::Code::NoSuchPath, "path does not resolve: " + path.toString()});
    }

    MaterializeResult result;
    result.totalCount = childCountOf(*element);
    result.offset     = std::min(options.offset, result.totalCount);
    if (result.totalCount == 0)
        return result;

    auto const remaining = result.totalCount - result.offset;
    auto const end       = result.offset + std::min(options.limit, remaining);
    auto const batchSize = std::max<std::size_t>(options.batchSize, 1);
    result.children.reserve(end - result.offset);

    bool const isObject = element->is_object();
    for (std::size_t batchStart = result.offset; batchStart < end; batchStart += batchSize) {
        if (auto error = token.check())
            return std::unexpected(std::move(*error));

        auto const batchEnd = std::min(end, batchStart + batchSize);
        LazyNode::Children batch;
        batch.reserve(batchEnd - batchStart);
        if (isObject) {
            // ordered_map is a vector of pairs; its operator[] is keyed, so walk by iterator.
            auto const& object = element->get_ref<Json::object_t const&>();
            auto        it     = object.begin() + static_cast<std::ptrdiff_t>(batchStart);
            for (auto i = batchStart; i < batchEnd; ++i, ++it)
                batch.push_back(makeNode(it->second, path.child(it->first), options.previewLength));
        } else {
            auto const& array = element->get_ref<Json::array_t const&>();
            for (auto i = batchStart; i < batchEnd; ++i)
                batch.push_back(makeNode(array[i], path.child(i), options.previewLength));
        }

        if (onBatch)
            onBatch(batch);
        result.children.insert(result.children.end(), batch.begin(), batch.end());
    }

    result.partial = end < result.totalCount;
    return result;
}

} // namespace JL
