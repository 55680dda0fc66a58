#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
decltype(auto) stringify(T&& x) {
    using DT = std::decay_t<T>;
    if constexpr (std::is_same_v<DT, char>) {
        return std::string(1, x);
    } else if constexpr (std::is_same_v<DT, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_integral_v<DT> or std::is_floating_point_v<DT>) {
        return std::to_string(x);
    } else {
        static_assert(
            std::is_convertible_v<T&&, std::string_view>, "argument has to be string-like"
        );
        return std::string_view{x};
    }
}

} // namespace detail

template <class... Args>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        std::string res;
        res.reserve((std::size_t{0} + ... + std::string_view{str}.size()));
        (void)(res += ... += str);
        return res;
    }(detail::stringify(std::forward<Args>(args))...);
}

template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve((str.size() + ... + std::string_view{xx}.size()));
        return (str += ... += xx);
    }(detail::stringify(std::forward<Args>(args))...);
}
