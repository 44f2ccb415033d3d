#pragma once

#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace sandtest {

struct UnexpectedT
{
};

inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Types T and E must not be convertible between one another, unless the error is
 * constructed explicitly with the ``unexpected`` tag.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::in_place_index<0>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::same_as<std::remove_cvref_t<Tu>, Expected>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::convertible_to<Eu, T> &&
                 !std::same_as<std::remove_cvref_t<Eu>, Expected>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Expected::value() called on an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Expected::value() called on an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value(), "Expected::value() called on an error");
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
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        ASSERT(!has_value(), "Expected::error() called on a value");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr Expected<std::invoke_result_t<Func, const T&>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return {unexpected, error()};
        }

        return func(value());
    }

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
        requires(!std::same_as<Eu, Expected> && !std::equality_comparable_with<Eu, T> &&
                 std::equality_comparable_with<Eu, E>)
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<ValueStorage, E> data_;
};

} // namespace sandtest

template <typename T, typename E>
struct fmt::formatter<::sandtest::Expected<T, E>> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::has_formatter<E, fmt::format_context>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::same_as<T, void>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::has_formatter<T, fmt::format_context>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
