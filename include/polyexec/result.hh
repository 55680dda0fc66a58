#pragma once

#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept(std::is_nothrow_move_constructible_v<T>)
    : val{std::move(val)} {}
};

template <class E>
struct Err {
    E err;

    constexpr explicit Err(E err) noexcept(std::is_nothrow_move_constructible_v<E>)
    : err{std::move(err)} {}
};

// Either a value or an error, the error is not an exceptional situation
template <class T, class E>
class Result {
    std::variant<Ok<T>, Err<E>> v_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok) : v_{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err) : v_{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return v_.index() == 0; }

    [[nodiscard]] constexpr bool is_err() const noexcept { return v_.index() == 1; }

    // Throws std::bad_variant_access if *this holds an error
    constexpr T unwrap() && { return std::get<0>(std::move(v_)).val; }

    // Throws std::bad_variant_access if *this holds a value
    constexpr E unwrap_err() && { return std::get<1>(std::move(v_)).err; }
};
