// File: src/support/result.hpp
// Purpose: Provides a Result type pairing a value with a typed error.
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Result owns contained value or error.
#pragma once

#include <optional>
#include <string>
#include <utility>

/// @brief Minimal expected-like container with a caller-chosen error type.
/// @invariant Either holds a value or an error.
/// @ownership Owns stored value/error.
namespace avrokit::support
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

/// @brief Sentinel instance for success construction convenience.
inline constexpr SuccessTag kSuccessTag{};

/// @brief Tag type used to construct failed Result values explicitly.
struct ErrorTag
{
    constexpr ErrorTag() = default;
};

inline constexpr ErrorTag kErrorTag{};

template <typename T, typename E = std::string> class Result
{
  public:
    /// @brief Creates a successful result containing a value.
    template <typename U = T> Result(SuccessTag /*tag*/, U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Creates a failed result holding @p error.
    Result(ErrorTag /*tag*/, E error) : error_(std::move(error)) {}

    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    static Result failure(E error)
    {
        return Result(kErrorTag, std::move(error));
    }

    /// @brief Indicates whether the Result currently holds a value.
    /// @invariant When true, @c value() is valid; when false, @c error() is valid.
    [[nodiscard]] bool isOk() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return true.
    T &value()
    {
        return *value_;
    }

    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return *value_;
    }

    /// @pre @c isOk() must return false.
    const E &error() const
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Result specialization for operations that only report failure.
template <typename E> class Result<void, E>
{
  public:
    /// @brief Creates a successful result.
    Result() = default;

    Result(ErrorTag /*tag*/, E error) : error_(std::move(error)) {}

    static Result success()
    {
        return Result();
    }

    static Result failure(E error)
    {
        return Result(kErrorTag, std::move(error));
    }

    [[nodiscard]] bool isOk() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return false.
    const E &error() const
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};
} // namespace avrokit::support
