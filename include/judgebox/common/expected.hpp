#pragma once

#include <judgebox/common/extra_formatters.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace judgebox {

/// Tag to construct an Expected in the error state when T and E could be confused
struct UnexpectedT
{
};

inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type (may be void)
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<Tu>, Expected> &&
                 std::convertible_to<Tu, ValueStorage> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<Eu>, Expected> && std::convertible_to<Eu, E> &&
                 (std::is_void_v<T> || !std::convertible_to<Eu, ValueStorage>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() & {
        DEBUG_ASSERT(has_value(), "Bad Expected value access", error_string());
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const& {
        DEBUG_ASSERT(has_value(), "Bad Expected value access", error_string());
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U&& value() && {
        DEBUG_ASSERT(has_value(), "Bad Expected value access", error_string());
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const& {
        DEBUG_ASSERT(has_value(), "Bad Expected value access", error_string());
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& operator*() & {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& operator*() const& {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U* operator->() {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U* operator->() const {
        return &value();
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    constexpr T value_or(Tu&& default_value) const {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error(), "Bad Expected error access");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    /// Apply ``func`` to the contained value, propagating an error untouched
    template <typename Func>
    constexpr auto transform(const Func& func) const -> Expected<std::invoke_result_t<Func, const T&>, E>
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
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T> &&
                 !std::equality_comparable_with<Tu, E>)
    constexpr bool operator==(const Tu& rhs) const {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    constexpr bool operator==(const Eu& rhs) const {
        return has_error() && error() == rhs;
    }

private:
    std::string error_string() const {
        if constexpr (fmt::is_formattable<E>::value) {
            return has_error() ? fmt::format("{}", std::get<1>(data_)) : std::string{};
        } else {
            return "<unformattable>";
        }
    }

    std::variant<ValueStorage, E> data_;
};

} // namespace judgebox

template <typename T, typename E>
struct fmt::formatter<::judgebox::Expected<T, E>> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::Expected<T, E>& from, format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
