#include "execution/transcript_recorder.hpp"

#include <iojudge/interaction/interaction.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace iojudge {

void TranscriptRecorder::record_output(std::string_view chunk) {
    pending_output_ += chunk;
}

void TranscriptRecorder::record_input(std::string value) {
    auto last_newline = pending_output_.rfind('\n');

    if (last_newline != std::string::npos) {
        transcript_.push_back(Interaction::output(pending_output_.substr(0, last_newline)));
        pending_output_.erase(0, last_newline + 1);
    }

    transcript_.push_back(Interaction::prompt(std::exchange(pending_output_, {})));
    transcript_.push_back(Interaction::input(std::move(value)));
}

Transcript TranscriptRecorder::finish() {
    if (!pending_output_.empty()) {
        if (pending_output_.ends_with('\n')) {
            pending_output_.pop_back();
        }
        transcript_.push_back(Interaction::output(std::exchange(pending_output_, {})));
    }

    return std::exchange(transcript_, {});
}

} // namespace iojudge
