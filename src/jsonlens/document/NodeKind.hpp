#pragma once
#include <nlohmann/json.hpp>

#include <string_view>

namespace JL {

// Object properties keep their source order.
using Json = nlohmann::ordered_json;

enum class NodeKind {
    Object,
    Array,
    String,
    Number,
    Boolean,
    Null
};

[[nodiscard]] inline auto kindOf(Json const& element) -> NodeKind {
    switch (element.type()) {
    case Json::value_t::object:
        return NodeKind::Object;
    case Json::value_t::array:
        return NodeKind::Array;
    case Json::value_t::string:
        return NodeKind::String;
    case Json::value_t::boolean:
        return NodeKind::Boolean;
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float:
        return NodeKind::Number;
    default:
        return NodeKind::Null;
    }
}

[[nodiscard]] constexpr auto kindToString(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Object:
        return "object";
    case NodeKind::Array:
        return "array";
    case NodeKind::String:
        return "string";
    case NodeKind::Number:
        return "number";
    case NodeKind::Boolean:
        return "boolean";
    case NodeKind::Null:
        return "null";
    }
    return "null";
}

[[nodiscard]] constexpr auto isContainer(NodeKind kind) -> bool {
    return kind == NodeKind::Object || kind == NodeKind::Array;
}

// Declared cardinality: properties for objects, length for arrays, zero for scalars.
[[nodiscard]] inline auto childCountOf(Json const& element) -> std::size_t {
    return element.is_structured() ? element.size() : 0;
}

} // namespace JL
