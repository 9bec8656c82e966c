#pragma once
#include <string_view>

namespace JL {

// Whole-string glob match: '*' any run, '?' one character, '[abc]', '[a-z]', '[!x]' classes, '\' escapes.
// ASCII letters compare case-insensitively unless caseSensitive.
auto globMatch(std::string_view pattern, std::string_view text, bool caseSensitive = false) -> bool;

} // namespace JL
