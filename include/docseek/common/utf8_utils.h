#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docseek::common {

namespace detail {

// Length of the well-formed sequence starting at @p i, or 0 when it is not one.
inline size_t utf8SequenceLength(std::string_view input, size_t i) {
    const auto lead = static_cast<unsigned char>(input[i]);
    size_t len = 0;
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        len = 2;
    else if (lead >= 0xE0 && lead <= 0xEF)
        len = 3;
    else if (lead >= 0xF0 && lead <= 0xF4)
        len = 4;
    else
        return 0;

    if (i + len > input.size())
        return 0;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(input[i + k]) & 0xC0) != 0x80)
            return 0;
    }
    return len;
}

} // namespace detail

/**
 * @brief Byte offset just past the first @p maxChars code points of @p text
 *
 * Never lands inside a multi-byte sequence. Malformed bytes count as one
 * character each.
 */
inline size_t utf8Prefix(std::string_view text, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size() && chars < maxChars) {
        size_t len = detail::utf8SequenceLength(text, i);
        i += len == 0 ? 1 : len;
        ++chars;
    }
    return i;
}

/**
 * @brief At most @p maxChars code points of @p text, cut on a character boundary
 */
inline std::string utf8Truncate(std::string_view text, size_t maxChars) {
    return std::string(text.substr(0, utf8Prefix(text, maxChars)));
}

} // namespace docseek::common
