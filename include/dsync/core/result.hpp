#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace dsync {

// Tag wrappers so a Result<T, E> can be built even when T and E coincide
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

/**
 * @brief Value-or-error return type used across every module boundary
 *
 * Nothing in the engine throws across modules: fallible calls return a
 * Result and the caller decides whether to recover, retry or propagate.
 */
template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    // Moves the value out; used for move-only payloads such as owning handles
    T take_value() { return std::move(std::get<0>(data_)); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    // Re-wraps the error of a failed result for a caller returning another T
    template<typename U>
    Result<U, E> forward_error() const {
        return Result<U, E>(ErrValue<E>(error()));
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    template<typename U>
    Result<U, E> forward_error() const {
        return Result<U, E>(ErrValue<E>(error()));
    }

private:
    std::optional<E> error_;
};

} // namespace dsync
