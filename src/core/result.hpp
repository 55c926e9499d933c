/**
 * @file result.hpp
 * @brief Monadic error handling type for NodeOrder.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> carries recoverable failures (heuristic errors, unknown
 * nodes, bad configuration) through the scoring core without exceptions.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace node_order {

/**
 * @brief Error type carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Same error with "<context>: " in front of the message.
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error{std::string{context} + ": " + message};
    }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    [[nodiscard]] std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "error";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message) {
    return Result<T, E>(E{std::move(message)});
}

}  // namespace node_order
