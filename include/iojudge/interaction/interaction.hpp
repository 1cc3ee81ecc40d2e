#pragma once

#include <iojudge/common/formatters/enum.hpp>

#include <string>
#include <vector>

namespace iojudge {

enum class InteractionKind {
    Prompt, ///< Text written by the program immediately before it consumed an input
    Input,  ///< A value supplied to the program's standard input
    Output, ///< Any other text written by the program
};

/// How an expected value should be compared against observed text
enum class ValueHint {
    Auto,            ///< Numeric tolerance only for floating-point literals
    Text,            ///< Never compare numerically
    Numeric,         ///< Always compare numbers within tolerance
    CaseInsensitive, ///< Text comparison ignoring letter case
};

/// A single exchange with the program's standard streams
struct Interaction
{
    InteractionKind kind;
    std::string text;

    /// Other accepted values for an expected Prompt/Output (empty for observed interactions)
    std::vector<std::string> alternatives{};

    ValueHint hint = ValueHint::Auto;

    static Interaction prompt(std::string text) { return {InteractionKind::Prompt, std::move(text)}; }

    static Interaction input(std::string value) { return {InteractionKind::Input, std::move(value)}; }

    static Interaction output(std::string text) { return {InteractionKind::Output, std::move(text)}; }

    bool is_program_text() const { return kind != InteractionKind::Input; }

    bool operator==(const Interaction&) const = default;
};

/// Ordered record of the interactions of one program execution
using Transcript = std::vector<Interaction>;

/// One expected transcript
struct TestCase
{
    Transcript expected;

    /// The values to feed to the program, in order
    std::vector<std::string> inputs() const;

    /// Converts to the shape produced by stream-mode execution:
    /// every input first, followed by all program text concatenated into a single Output
    TestCase to_stream() const;

    bool operator==(const TestCase&) const = default;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::InteractionKind, Prompt, Input, Output);
FMT_SERIALIZE_ENUM(::iojudge::ValueHint, Auto, Text, Numeric, CaseInsensitive);

template <>
struct fmt::formatter<::iojudge::Interaction> : fmt::formatter<std::string>
{
    auto format(const ::iojudge::Interaction& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(fmt::format("{}({:?})", from.kind, from.text), ctx);
    }
};
