#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * @brief Makes a valid UTF-8 string out of arbitrary bytes
 * @details Well-formed UTF-8 sequences (ASCII control characters included) are
 *   copied as they are. Every other byte (stray continuation byte, truncated,
 *   overlong or surrogate sequence, code point above U+10FFFF) becomes the four
 *   characters "\xHH", e.g. "ok\xff" -> "ok\\xff".
 */
std::string escape_bytes_to_utf8_str(std::string_view bytes);

// Longest prefix of @p str no longer than @p max_len that does not end inside
// a multi-byte UTF-8 character
std::string_view utf8_prefix(std::string_view str, size_t max_len) noexcept;
