#pragma once

#include <iojudge/common/formatters/enum.hpp>
#include <iojudge/interaction/interaction.hpp>

#include <optional>
#include <string_view>

namespace iojudge {

inline constexpr double DEFAULT_RELATIVE_TOLERANCE = 1e-9;
inline constexpr double DEFAULT_ABSOLUTE_TOLERANCE = 1e-12;

struct Tolerance
{
    double relative = DEFAULT_RELATIVE_TOLERANCE;
    double absolute = DEFAULT_ABSOLUTE_TOLERANCE;
};

enum class TextMatch {
    Equal,        ///< Same tokens and same whitespace/newlines
    Presentation, ///< Same tokens, different whitespace/newlines
    Different,
};

/// Parses a whole token as a number: an optional sign, digits, and an optional fraction/exponent.
/// "inf", "nan" and hexadecimal forms are rejected.
std::optional<double> parse_number(std::string_view token);

/// Whether |a - b| <= max(relative * max(|a|, |b|), absolute)
bool within_tolerance(double lhs, double rhs, const Tolerance& tolerance);

/// Compares a single whitespace-free token
bool tokens_match(std::string_view expected, std::string_view observed, ValueHint hint, const Tolerance& tolerance);

/// Tolerant text comparison. Both texts are split into tokens separated by runs of whitespace;
/// tokens are compared with ``tokens_match``, and the separators decide between Equal and Presentation.
TextMatch compare_text(std::string_view expected, std::string_view observed, ValueHint hint = ValueHint::Auto,
                       const Tolerance& tolerance = {});

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::TextMatch, Equal, Presentation, Different);
