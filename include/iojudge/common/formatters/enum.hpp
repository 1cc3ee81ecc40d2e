#pragma once

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/format.h>

#include <string_view>

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, ident)                                                             \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Defines a fmt::formatter for an enum which prints the enumerator's identifier.
/// Must be used at global namespace scope, with a fully qualified enum name.
///
/// Usage:
///   FMT_SERIALIZE_ENUM(::iojudge::ErrorKind, TimedOut, SyscallFailure);
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : fmt::formatter<std::string_view>                                                \
    {                                                                                                                  \
        static constexpr std::string_view enumerator_name(enum_name from) {                                            \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))  \
            }                                                                                                          \
            return "<unknown>";                                                                                        \
        }                                                                                                              \
                                                                                                                       \
        auto format(enum_name from, fmt::format_context& ctx) const {                                                  \
            return fmt::formatter<std::string_view>::format(enumerator_name(from), ctx);                               \
        }                                                                                                              \
    }
