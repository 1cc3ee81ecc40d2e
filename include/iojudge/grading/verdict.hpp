#pragma once

#include <iojudge/common/formatters/enum.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace iojudge {

enum class VerdictKind {
    Correct,
    WrongAnswer,
    PresentationError,
    RuntimeError,
    Timeout,
    BuildError,
};

/// Location and values of the first mismatching interaction
struct Mismatch
{
    /// Index into the expected/observed transcripts
    std::size_t index{};

    /// Absent if the observed transcript is longer than the expected one
    std::optional<std::string> expected;

    /// Absent if the program stopped before producing this interaction
    std::optional<std::string> observed;

    bool operator==(const Mismatch&) const = default;
};

struct Verdict
{
    VerdictKind kind = VerdictKind::Correct;
    std::optional<Mismatch> mismatch{};

    /// Diagnosis, e.g. compiler output or a description of the mismatch
    std::string message{};

    bool is_correct() const { return kind == VerdictKind::Correct; }

    bool operator==(const Verdict&) const = default;
};

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::VerdictKind, Correct, WrongAnswer, PresentationError, RuntimeError, Timeout, BuildError);
