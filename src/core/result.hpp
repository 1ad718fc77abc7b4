/**
 * @file result.hpp
 * @brief Value-or-error return type for lineproto_csv.
 *
 * Result<T, E> is how fallible operations report failure: config loading,
 * file I/O, directory conversion and line parsing. Exceptions from
 * third-party code are translated into a Result at the module boundary.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace lineproto_csv {

/**
 * @brief Generic error carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value");
        return std::get<E>(storage_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return std::get<T>(storage_);
        return fallback;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that only report success or failure.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Shorthand for an Error-carrying failure.
template <typename T>
Result<T> make_error(std::string message) {
    return Result<T>(Error{std::move(message)});
}

}  // namespace lineproto_csv
