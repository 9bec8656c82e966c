#pragma once
#include "document/Document.hpp"
#include "tree/LazyNode.hpp"

#include <string>

namespace JL {

struct SerializeOptions {
    int  indent       = 2;    // negative for compact output
    bool fillUnloaded = true; // take unmaterialized subtrees from the document instead of emitting them empty
};

// Inverse of materialization: object node -> object of its children, array node -> array, leaf -> raw value.
auto toJson(LazyNode const& node, Document const& document, SerializeOptions const& options = {}) -> Json;
auto serialize(LazyNode const& node, Document const& document, SerializeOptions const& options = {}) -> std::string;

} // namespace JL
