#pragma once

#include <iojudge/interaction/interaction.hpp>

#include <string>
#include <string_view>

namespace iojudge {

/// Accumulates stream events in the order they happen and turns them into a Transcript
///
/// Output is buffered until an input is recorded. At that point, the text up to and including
/// its last newline becomes an Output (without that newline), and the remainder becomes the
/// Prompt for the input, possibly empty. Output left at the end loses one trailing newline.
class TranscriptRecorder
{
public:
    void record_output(std::string_view chunk);

    void record_input(std::string value);

    /// Whether output was recorded since the last input
    bool has_pending_output() const { return !pending_output_.empty(); }

    Transcript finish();

private:
    Transcript transcript_;
    std::string pending_output_;
};

} // namespace iojudge
