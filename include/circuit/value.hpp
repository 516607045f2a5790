#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include "plonk/error.hpp"

namespace plonkish {

/**
 * Value<T> - A witness quantity that may not be known yet
 *
 * During shape-only synthesis (key derivation) every witness Value is unknown,
 * and everything derived from it through map/zip/and_then or the arithmetic
 * operators stays unknown without the combinator ever being invoked. During a
 * witness pass the same code yields known values. Combinators must therefore
 * be side-effect free.
 */
template<typename T>
class Value {
public:
    using value_type = T;

    // Default-constructed values are unknown
    Value() = default;

    static Value known(T value) {
        return Value(std::optional<T>(std::move(value)));
    }

    static Value unknown() { return Value(); }

    bool is_known() const { return inner_.has_value(); }

    /**
     * Backend access to the wrapped value.
     * Returns std::nullopt during shape-only synthesis.
     */
    const std::optional<T>& inner() const { return inner_; }

    template<typename Fn>
    auto map(Fn&& f) const -> Value<std::decay_t<std::invoke_result_t<Fn, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<Fn, const T&>>;
        if (!inner_) {
            return Value<U>::unknown();
        }
        return Value<U>::known(std::invoke(std::forward<Fn>(f), *inner_));
    }

    // f must return a Value<U>
    template<typename Fn>
    auto and_then(Fn&& f) const -> std::decay_t<std::invoke_result_t<Fn, const T&>> {
        using R = std::decay_t<std::invoke_result_t<Fn, const T&>>;
        if (!inner_) {
            return R::unknown();
        }
        return std::invoke(std::forward<Fn>(f), *inner_);
    }

    template<typename U>
    Value<std::pair<T, U>> zip(const Value<U>& other) const {
        if (!inner_ || !other.inner()) {
            return Value<std::pair<T, U>>::unknown();
        }
        return Value<std::pair<T, U>>::known(std::make_pair(*inner_, *other.inner()));
    }

    // Converts the wrapped value, e.g. Value<F> into Value<Assigned<F>>
    template<typename U>
    Value<U> into() const {
        return map([](const T& v) { return U(v); });
    }

    /**
     * Throws a Synthesis error if the value is known and pred holds.
     * Unknown values always pass.
     */
    template<typename Pred>
    void error_if_known_and(Pred&& pred, const std::string& what = "witness check") const {
        if (inner_ && std::invoke(std::forward<Pred>(pred), *inner_)) {
            throw Error::synthesis(what + " failed on a known value");
        }
    }

    Value operator-() const {
        return map([](const T& v) { return -v; });
    }

private:
    explicit Value(std::optional<T> inner) : inner_(std::move(inner)) {}

    std::optional<T> inner_;
};

// =========================================================================
// Arithmetic on deferred values
// =========================================================================

template<typename T>
Value<T> operator+(const Value<T>& lhs, const Value<T>& rhs) {
    return lhs.zip(rhs).map([](const std::pair<T, T>& p) { return p.first + p.second; });
}

template<typename T>
Value<T> operator-(const Value<T>& lhs, const Value<T>& rhs) {
    return lhs.zip(rhs).map([](const std::pair<T, T>& p) { return p.first - p.second; });
}

template<typename T>
Value<T> operator*(const Value<T>& lhs, const Value<T>& rhs) {
    return lhs.zip(rhs).map([](const std::pair<T, T>& p) { return p.first * p.second; });
}

template<typename T>
Value<T> operator+(const Value<T>& lhs, const T& rhs) {
    return lhs.map([&rhs](const T& v) { return v + rhs; });
}

template<typename T>
Value<T> operator-(const Value<T>& lhs, const T& rhs) {
    return lhs.map([&rhs](const T& v) { return v - rhs; });
}

template<typename T>
Value<T> operator*(const Value<T>& lhs, const T& rhs) {
    return lhs.map([&rhs](const T& v) { return v * rhs; });
}

} // namespace plonkish
