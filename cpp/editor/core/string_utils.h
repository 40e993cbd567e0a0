#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace editor {

// =============================================================================
// Whitespace Helpers
// =============================================================================

/**
 * Copy of `s` without leading and trailing ASCII whitespace.
 */
inline std::string trimCopy(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return std::string(s.substr(begin, end - begin));
}

} // namespace editor
