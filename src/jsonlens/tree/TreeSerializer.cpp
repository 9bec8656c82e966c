#include "TreeSerializer.hpp"

namespace JL {

namespace {

auto emptyContainer(NodeKind kind) -> Json {
    return kind == NodeKind::Object ? Json::object() : Json::array();
}

} // namespace

auto toJson(LazyNode const& node, Document const& document, SerializeOptions const& options) -> Json {
    if (!node.isContainer())
        return node.scalar();

    // A snapshot is complete only when every declared child is attached.
    auto const children = node.children();
    bool const complete = node.isLoaded() && children.size() == node.childCount();
    if (!complete) {
        if (!options.fillUnloaded)
            return emptyContainer(node.kind());
        if (auto element = document.resolve(node.path()))
            return *element;
        return emptyContainer(node.kind());
    }

    Json result = emptyContainer(node.kind());
    for (auto const& child : children) {
        if (node.kind() == NodeKind::Object)
            result[child->path().back().name()] = toJson(*child, document, options);
        else
            result.push_back(toJson(*child, document, options));
    }
    return result;
}

auto serialize(LazyNode const& node, Document const& document, SerializeOptions const& options) -> std::string {
    return toJson(node, document, options).dump(options.indent);
}

} // namespace JL
