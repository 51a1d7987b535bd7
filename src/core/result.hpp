#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace chronoid {

/**
 * Failure categories reported by UUID construction.
 *
 * Usage:      the caller supplied zero or several mutually exclusive sources.
 * Validation: a value was outside its declared width, shape or format.
 */
enum class ErrorKind {
    Usage,
    Validation,
};

[[nodiscard]] constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Usage: return "usage";
        case ErrorKind::Validation: return "validation";
    }
    return "unknown";
}

/**
 * Error type for Result - a message plus the category it belongs to.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Validation};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Validation)
        : message(std::move(msg)), kind(k) {}

    [[nodiscard]] static Error usage(std::string msg) {
        return Error{std::move(msg), ErrorKind::Usage};
    }

    [[nodiscard]] static Error validation(std::string msg) {
        return Error{std::move(msg), ErrorKind::Validation};
    }

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind;
    }
};

/**
 * Result<T, E> - either a value (Ok) or an error (Err).
 *
 * Every construction path of the UUID value type reports through this
 * type; nothing is ever partially built.
 *
 *   auto parsed = Uuid::from_string("0189...")
 *       .map([](const Uuid& u) { return u.version(); });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing std::runtime_error if this is an error.
     */
    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) {
            throw_unwrap_error();
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) {
            throw_unwrap_error();
        }
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    [[noreturn]] void throw_unwrap_error() const {
        if constexpr (std::is_same_v<E, Error>) {
            const auto& e = std::get<1>(data_);
            throw std::runtime_error(std::string("Result::unwrap() called on ") +
                                     to_string(e.kind) + " error: " + e.message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

} // namespace chronoid
