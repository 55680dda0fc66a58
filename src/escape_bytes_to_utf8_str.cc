#include <cstddef>
#include <polyexec/escape_bytes_to_utf8_str.hh>
#include <polyexec/string_transform.hh>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

namespace {

constexpr bool is_a_continuation_byte(unsigned char c) noexcept {
    return (c & 0b11000000) == 0b10000000;
}

// Length of the well-formed UTF-8 sequence starting at @p pos, 0 if there is none
size_t valid_sequence_length(string_view bytes, size_t pos) noexcept {
    auto byte = [&](size_t i) -> unsigned char { return bytes[pos + i]; };
    unsigned char c = byte(0);
    if (c < 0x80) {
        return 1;
    }
    size_t len = 0;
    // Allowed range of the second byte, it excludes overlong forms, surrogates
    // and code points above U+10FFFF
    unsigned char lo = 0x80;
    unsigned char hi = 0xbf;
    if (0xc2 <= c and c <= 0xdf) {
        len = 2;
    } else if (0xe0 <= c and c <= 0xef) {
        len = 3;
        if (c == 0xe0) {
            lo = 0xa0;
        } else if (c == 0xed) {
            hi = 0x9f;
        }
    } else if (0xf0 <= c and c <= 0xf4) {
        len = 4;
        if (c == 0xf0) {
            lo = 0x90;
        } else if (c == 0xf4) {
            hi = 0x8f;
        }
    } else {
        return 0;
    }

    if (pos + len > bytes.size() or byte(1) < lo or byte(1) > hi) {
        return 0;
    }
    for (size_t i = 2; i < len; ++i) {
        if (not is_a_continuation_byte(byte(i))) {
            return 0;
        }
    }
    return len;
}

} // namespace

string escape_bytes_to_utf8_str(string_view bytes) {
    string res;
    res.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        if (auto len = valid_sequence_length(bytes, i)) {
            res.append(bytes.data() + i, len);
            i += len;
            continue;
        }
        auto c = static_cast<unsigned char>(bytes[i]);
        res += "\\x";
        res += dec2hex(c >> 4);
        res += dec2hex(c & 15);
        ++i;
    }
    return res;
}

string_view utf8_prefix(string_view str, size_t max_len) noexcept {
    if (str.size() <= max_len) {
        return str;
    }
    // str[max_len] is the first cut off byte, a continuation byte there means
    // that the character it belongs to starts inside the prefix
    size_t len = max_len;
    while (len > 0 and is_a_continuation_byte(str[len])) {
        --len;
    }
    // Not a cut character, just stray continuation bytes
    if (max_len - len >= 4) {
        return str.substr(0, max_len);
    }
    return str.substr(0, len);
}
