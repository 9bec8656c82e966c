#include "GlobMatcher.hpp"

#include <cctype>

namespace JL {

namespace {

auto fold(char c, bool caseSensitive) -> char {
    return caseSensitive ? c : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Matches one pattern element at globIdx against ch; on success nextIdx points past the element.
auto matchOne(std::string_view pattern, size_t globIdx, char ch, bool caseSensitive, size_t& nextIdx) -> bool {
    char const c = fold(ch, caseSensitive);
    if (pattern[globIdx] == '\\') {
        ++globIdx;
        if (globIdx >= pattern.size())
            return false;
        nextIdx = globIdx + 1;
        return fold(pattern[globIdx], caseSensitive) == c;
    }
    if (pattern[globIdx] == '?') {
        nextIdx = globIdx + 1;
        return true;
    }
    if (pattern[globIdx] == '[') {
        ++globIdx;
        bool invert = false;
        if (globIdx < pattern.size() && pattern[globIdx] == '!') {
            invert = true;
            ++globIdx;
        }

        bool matched  = false;
        char prevChar = '\0';
        while (globIdx < pattern.size() && pattern[globIdx] != ']') {
            if (pattern[globIdx] == '-' && prevChar != '\0' && globIdx + 1 < pattern.size() && pattern[globIdx + 1] != ']') {
                char const rangeEnd = fold(pattern[globIdx + 1], caseSensitive);
                if (c >= prevChar && c <= rangeEnd)
                    matched = true;
                globIdx += 2;
                prevChar = '\0';
            } else {
                prevChar = fold(pattern[globIdx], caseSensitive);
                if (c == prevChar)
                    matched = true;
                ++globIdx;
            }
        }
        if (globIdx >= pattern.size())
            return false; // Malformed pattern - missing closing bracket
        nextIdx = globIdx + 1;
        return matched != invert;
    }
    nextIdx = globIdx + 1;
    return fold(pattern[globIdx], caseSensitive) == c;
}

} // namespace

auto globMatch(std::string_view pattern, std::string_view text, bool caseSensitive) -> bool {
    constexpr size_t none = std::string_view::npos;

    size_t globIdx = 0;
    size_t strIdx  = 0;
    // Most recent '*' and the text position it currently absorbs up to, for backtracking.
    size_t starIdx     = none;
    size_t starTextIdx = 0;

    while (strIdx < text.size()) {
        if (globIdx < pattern.size()) {
            if (pattern[globIdx] == '*') {
                starIdx     = globIdx++;
                starTextIdx = strIdx;
                continue;
            }
            size_t nextIdx = globIdx;
            if (matchOne(pattern, globIdx, text[strIdx], caseSensitive, nextIdx)) {
                globIdx = nextIdx;
                ++strIdx;
                continue;
            }
        }
        if (starIdx == none)
            return false;
        globIdx = starIdx + 1;
        strIdx  = ++starTextIdx;
    }

    // Skip any remaining wildcards
    while (globIdx < pattern.size() && pattern[globIdx] == '*')
        ++globIdx;
    return globIdx == pattern.size();
}

} // namespace JL
