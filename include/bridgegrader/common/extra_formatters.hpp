#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/type_index.hpp>
#include <fmt/base.h>
#include <fmt/format.h>

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

#include <string.h>

namespace bridgegrader {

struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        const auto* it = ctx.begin();
        const auto* end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
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

} // namespace bridgegrader

/// Formatter for any enum annotated with BOOST_DESCRIBE_ENUM
/// `{}` prints the enumerator name, `{:?}` prefixes it with the enum's type name
template <::bridgegrader::DescribedEnum Enum>
struct fmt::formatter<Enum> : ::bridgegrader::DebugFormatter
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        auto name = ::bridgegrader::enum_to_string(from);

        if (!name) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{}::{}", boost::typeindex::type_id<Enum>().pretty_name(), *name);
        }

        return fmt::format_to(ctx.out(), "{}", *name);
    }
};

template <>
struct fmt::formatter<std::exception> : formatter<std::string>
{
    auto format(const std::exception& from, fmt::format_context& ctx) const {
        std::string str = fmt::format("{}: '{}'", boost::typeindex::type_id_runtime(from).pretty_name(), from.what());

        return formatter<std::string>::format(str, ctx);
    }
};

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    auto format(const std::filesystem::path& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(from.string(), ctx);
    }
};

/// Output formatter for make_error_code
template <>
struct fmt::formatter<std::error_code> : ::bridgegrader::DebugFormatter
{
    auto format(const std::error_code& from, format_context& ctx) const {
        const char* name = strerrorname_np(from.value());

        return format_to(ctx.out(), "{} : {}", name == nullptr ? "E?" : name, from.message());
    }
};

template <typename T>
struct fmt::formatter<std::optional<T>> : ::bridgegrader::DebugFormatter
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
