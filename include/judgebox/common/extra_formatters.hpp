#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/type_index.hpp>
#include <fmt/format.h>

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

#include <string.h> // strerrorname_np

namespace judgebox {

/// Base for formatters that accept an optional '?' (debug) specifier
struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin();
        auto end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format");
        }

        return it;
    }
};

// See: https://www.boost.org/doc/libs/1_81_0/libs/describe/doc/html/describe.html#example_printing_enums_ct
template <typename Enum>
    requires(std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value)
constexpr std::optional<const char*> enum_to_string(Enum enumerator) {
    std::optional<const char*> res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto descriptor) {
        if (enumerator == descriptor.value) {
            res = descriptor.name;
        }
    });

    return res;
}

template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

} // namespace judgebox

/// Formatter for every enum annotated with BOOST_DESCRIBE_ENUM
/// With the '?' specifier the enum's type name is prepended, e.g. `VerdictKind::Correct`
template <::judgebox::DescribedEnum Enum>
struct fmt::formatter<Enum> : ::judgebox::DebugFormatter
{
    auto format(const Enum& from, format_context& ctx) const {
        auto name = ::judgebox::enum_to_string(from);

        if (!name) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{}::{}", boost::typeindex::type_id<Enum>().pretty_name(), *name);
        }

        return fmt::format_to(ctx.out(), "{}", *name);
    }
};

/// Output formatter for make_error_code
template <>
struct fmt::formatter<std::error_code> : ::judgebox::DebugFormatter
{
    auto format(const std::error_code& from, format_context& ctx) const {
        const char* name = strerrorname_np(from.value());
        return fmt::format_to(ctx.out(), "{} : {}", name != nullptr ? name : "E?", from.message());
    }
};

template <>
struct fmt::formatter<std::exception> : formatter<std::string>
{
    auto format(const std::exception& from, format_context& ctx) const {
        std::string str = fmt::format("{}: '{}'", boost::typeindex::type_id_runtime(from).pretty_name(), from.what());

        return formatter<std::string>::format(str, ctx);
    }
};

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    auto format(const std::filesystem::path& from, format_context& ctx) const {
        return formatter<std::string>::format(from.string(), ctx);
    }
};

template <typename T>
struct fmt::formatter<std::optional<T>> : ::judgebox::DebugFormatter
{
    auto format(const std::optional<T>& from, format_context& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "nullopt");
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "Optional({})", from.value());
        }

        return fmt::format_to(ctx.out(), "{}", from.value());
    }
};
