#pragma once

/**
 * @file result.hpp
 * @brief Result type for fallible validate/sanitize operations
 *
 * @example
 * ```cpp
 * auto result = pathsafe::sanitize_filename("fi:l*e/name.txt");
 * if (result.isOk()) {
 *     std::cout << result.value() << "\n";  // "filename.txt"
 * } else {
 *     std::cerr << result.error().toString() << "\n";
 * }
 * ```
 */

#include "pathsafe/types.hpp"

#include <optional>
#include <utility>

namespace pathsafe {

/**
 * @brief Success value or error
 * @tparam T The success value type
 * @tparam E The error type (default: ValidationError)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = ValidationError>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) const -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace pathsafe
