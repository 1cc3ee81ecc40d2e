#include <iojudge/grading/text_compare.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/equal.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace iojudge {

namespace {

struct Tokenized
{
    std::vector<std::string_view> tokens;

    /// Whitespace runs around and between tokens; always tokens.size() + 1 elements
    std::vector<std::string_view> separators;
};

bool is_space(char chr) {
    return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

Tokenized tokenize(std::string_view text) {
    Tokenized result;
    std::size_t pos = 0;

    while (true) {
        std::size_t sep_start = pos;
        while (pos < text.size() && is_space(text[pos])) {
            ++pos;
        }
        result.separators.push_back(text.substr(sep_start, pos - sep_start));

        if (pos == text.size()) {
            break;
        }

        std::size_t token_start = pos;
        while (pos < text.size() && !is_space(text[pos])) {
            ++pos;
        }
        result.tokens.push_back(text.substr(token_start, pos - token_start));
    }

    return result;
}

std::string_view strip_plus(std::string_view token) {
    if (token.size() > 1 && token.front() == '+' && token[1] != '-' && token[1] != '+') {
        token.remove_prefix(1);
    }
    return token;
}

bool is_float_literal(std::string_view token) {
    return token.find_first_of(".eE") != std::string_view::npos;
}

std::optional<long long> parse_integer(std::string_view token) {
    token = strip_plus(token);

    long long value{};
    auto [end, err] = std::from_chars(token.data(), token.data() + token.size(), value);

    if (err != std::errc{} || end != token.data() + token.size()) {
        return std::nullopt;
    }

    return value;
}

bool equal_ignoring_case(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(lhs, rhs, [](char lhs_chr, char rhs_chr) {
        return std::tolower(static_cast<unsigned char>(lhs_chr)) == std::tolower(static_cast<unsigned char>(rhs_chr));
    });
}

} // namespace

std::optional<double> parse_number(std::string_view token) {
    token = strip_plus(token);

    // from_chars also accepts "inf" and "nan"
    if (!ranges::any_of(token, [](char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; })) {
        return std::nullopt;
    }

    double value{};
    auto [end, err] = std::from_chars(token.data(), token.data() + token.size(), value);

    if (err != std::errc{} || end != token.data() + token.size()) {
        return std::nullopt;
    }

    return value;
}

bool within_tolerance(double lhs, double rhs, const Tolerance& tolerance) {
    double scale = std::max(std::fabs(lhs), std::fabs(rhs));

    return std::fabs(lhs - rhs) <= std::max(tolerance.relative * scale, tolerance.absolute);
}

bool tokens_match(std::string_view expected, std::string_view observed, ValueHint hint, const Tolerance& tolerance) {
    if (expected == observed) {
        return true;
    }

    switch (hint) {
    case ValueHint::Text:
        return false;

    case ValueHint::CaseInsensitive:
        return equal_ignoring_case(expected, observed);

    case ValueHint::Numeric: {
        auto exp_num = parse_number(expected);
        auto obs_num = parse_number(observed);
        return exp_num && obs_num && within_tolerance(*exp_num, *obs_num, tolerance);
    }

    case ValueHint::Auto:
        break;
    }

    if (is_float_literal(expected)) {
        auto exp_num = parse_number(expected);
        auto obs_num = parse_number(observed);
        return exp_num && obs_num && within_tolerance(*exp_num, *obs_num, tolerance);
    }

    // Integers only match integers of the same value ("06" and "+6" match "6"; "6.0" does not)
    auto exp_int = parse_integer(expected);
    auto obs_int = parse_integer(observed);

    return exp_int && obs_int && *exp_int == *obs_int;
}

TextMatch compare_text(std::string_view expected, std::string_view observed, ValueHint hint,
                       const Tolerance& tolerance) {
    if (expected == observed) {
        return TextMatch::Equal;
    }

    Tokenized exp_tokens = tokenize(expected);
    Tokenized obs_tokens = tokenize(observed);

    if (exp_tokens.tokens.size() != obs_tokens.tokens.size()) {
        return TextMatch::Different;
    }

    for (std::size_t i = 0; i < exp_tokens.tokens.size(); ++i) {
        if (!tokens_match(exp_tokens.tokens[i], obs_tokens.tokens[i], hint, tolerance)) {
            return TextMatch::Different;
        }
    }

    return exp_tokens.separators == obs_tokens.separators ? TextMatch::Equal : TextMatch::Presentation;
}

} // namespace iojudge
