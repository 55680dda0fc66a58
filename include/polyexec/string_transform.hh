#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

constexpr char to_lower(char c) noexcept {
    return (c >= 'A' and c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
}

inline std::string to_lower(std::string_view str) {
    std::string res;
    res.reserve(str.size());
    for (char c : str) {
        res += to_lower(c);
    }
    return res;
}

constexpr char dec2hex(int x) noexcept {
    return static_cast<char>(x > 9 ? 'a' - 10 + x : x + '0');
}

constexpr bool is_space(char c) noexcept {
    return (c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or c == '\v');
}

constexpr std::string_view trim(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

constexpr bool has_prefix(std::string_view str, std::string_view prefix) noexcept {
    return str.substr(0, prefix.size()) == prefix;
}

constexpr bool has_suffix(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() and str.substr(str.size() - suffix.size()) == suffix;
}

// Parses the whole @p str as an integer, std::nullopt on any garbage or overflow
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }
    if (str.front() == '+') {
        str.remove_prefix(1);
    }
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

// Replaces every occurrence of @p pattern in @p str with @p replacement
inline std::string
replace_all(std::string_view str, std::string_view pattern, std::string_view replacement) {
    if (pattern.empty()) {
        return std::string{str};
    }
    std::string res;
    size_t pos = 0;
    for (;;) {
        size_t next = str.find(pattern, pos);
        if (next == std::string_view::npos) {
            res += str.substr(pos);
            return res;
        }
        res += str.substr(pos, next - pos);
        res += replacement;
        pos = next + pattern.size();
    }
}
