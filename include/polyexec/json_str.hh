#pragma once

#include <cstddef>
#include <optional>
#include <polyexec/concat_tostr.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace json_str {

namespace detail {

template <class...>
constexpr inline bool is_std_optional = false;
template <class T>
constexpr inline bool is_std_optional<std::optional<T>> = true;

} // namespace detail

// Appends @p str to @p res as a double-quoted JSON string
void append_stringified_json(std::string& res, std::string_view str);

class Object {
    std::string str_{'{'};

    template <class T>
    void append_value(T&& val) {
        using DT = std::decay_t<T>;
        if constexpr (std::is_same_v<DT, bool>) {
            str_ += (val ? "true" : "false");
        } else if constexpr (std::is_same_v<DT, std::nullptr_t> or
                             std::is_same_v<DT, std::nullopt_t>)
        {
            str_ += "null";
        } else if constexpr (std::is_integral_v<DT>) {
            back_insert(str_, val);
        } else if constexpr (detail::is_std_optional<DT>) {
            if (val) {
                append_value(*val);
            } else {
                str_ += "null";
            }
        } else {
            append_stringified_json(str_, std::string_view{val});
        }
    }

public:
    template <class T>
    Object& prop(std::string_view name, T&& val) {
        if (str_.size() > 1) {
            str_ += ',';
        }
        append_stringified_json(str_, name);
        str_ += ':';
        append_value(std::forward<T>(val));
        return *this;
    }

    [[nodiscard]] std::string into_str() && {
        str_ += '}';
        return std::move(str_);
    }
};

} // namespace json_str
