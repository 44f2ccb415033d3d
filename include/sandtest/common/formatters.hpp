#pragma once

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <boost/type_index.hpp>
#include <fmt/format.h>

#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace sandtest {

/// Base for formatters that accept an optional `?` (debug) spec
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

} // namespace sandtest

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, ident)                                                             \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Specializes fmt::formatter for an enum, printing enumerator names. `{:?}` prints `EnumName{Enumerator}`
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::sandtest::DebugFormatter                                                      \
    {                                                                                                                  \
        static constexpr std::string_view enumerator_name(enum_name from) {                                            \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)) \
            }                                                                                                          \
            return {};                                                                                                 \
        }                                                                                                              \
                                                                                                                       \
        auto format(enum_name from, fmt::format_context& ctx) const {                                                  \
            std::string_view name = enumerator_name(from);                                                             \
            if (name.empty()) {                                                                                        \
                return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));                             \
            }                                                                                                          \
            if (is_debug_format) {                                                                                     \
                return fmt::format_to(ctx.out(), "{}{{{}}}", #enum_name, name);                                        \
            }                                                                                                          \
            return fmt::format_to(ctx.out(), "{}", name);                                                              \
        }                                                                                                              \
    }

template <>
struct fmt::formatter<std::error_code> : formatter<std::string>
{
    auto format(const std::error_code& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(fmt::format("{}:{} ({})", from.category().name(), from.value(),
                                                          from.message()),
                                              ctx);
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
