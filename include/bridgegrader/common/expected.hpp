#pragma once

#include <bridgegrader/common/extra_formatters.hpp>

#include <fmt/base.h>
#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace bridgegrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<T, E>)
        : data_{std::forward<Eu>(error)} {}

    constexpr bool has_value() const {
        if constexpr (std::is_void_v<T>) {
            return std::holds_alternative<std::monostate>(data_.data);
        } else {
            return std::holds_alternative<T>(data_.data);
        }
    }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        return const_cast<U&>(const_cast<const Expected*>(this)->value());
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        static_assert(std::same_as<U, T>,
                      "Do not attempt to instantiate Expected<T,E>::value() for any type other than T");
        ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<U>(data_.data);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<T>(data_.data);
    }

    constexpr E error() const {
        ASSERT(!has_value(), "error() called on an Expected holding a value");
        return std::get<E>(data_.data);
    }

    template <typename Func>
    constexpr Expected<std::invoke_result_t<Func, T>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    /// Map the error type, keeping the value as-is. Used to lift syscall errors
    /// (std::error_code) into a domain-specific error type.
    template <typename Func>
    constexpr Expected<T, std::invoke_result_t<Func, E>> transform_error(const Func& func) const {
        if (!has_value()) {
            return func(error());
        }

        if constexpr (std::is_void_v<T>) {
            return {};
        } else {
            return value();
        }
    }

private:
    template <typename Td, typename Ed>
    struct ExpectedData
    {
        std::variant<Td, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
    };

    template <typename Ed>
    struct ExpectedData<void, Ed>
    {
        std::variant<std::monostate, Ed> data;
        constexpr bool operator==(const ExpectedData& rhs) const = default;
    };

public:
    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        if (!has_value()) {
            return false;
        }

        return value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    ExpectedData<T, E> data_;
};

namespace detail {

/// Moves the contained value out of `exp`. Backs the TRY macros, so that move-only types
/// (e.g., file descriptors) can be propagated.
template <typename T, typename E>
constexpr T take_value(Expected<T, E>&& exp) {
    if constexpr (std::is_void_v<T>) {
        exp.value();
        return;
    } else {
        return std::move(exp.value());
    }
}

} // namespace detail

} // namespace bridgegrader

template <typename T, typename E>
struct fmt::formatter<::bridgegrader::Expected<T, E>> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", format_impl(from));
    }

private:
    static std::string format_impl(const ::bridgegrader::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::formattable<E>) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::same_as<T, void>) {
            return "Expected(void)";
        } else if constexpr (fmt::formattable<T>) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
