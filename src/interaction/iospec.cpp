#include <iojudge/interaction/iospec.hpp>

#include <iojudge/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iojudge::iospec {

namespace {

constexpr std::string_view FORCED_OUTPUT_MARKER = "-->";
constexpr char COMMENT_CHAR = '#';

bool is_blank(std::string_view line) {
    return ranges::all_of(line, [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; });
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;

    while (!text.empty()) {
        auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);

        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }

        lines.push_back(line);

        if (eol == std::string_view::npos) {
            break;
        }
        text.remove_prefix(eol + 1);
    }

    return lines;
}

constexpr char ESCAPE_CHAR = '\\';

/// Characters that lose their meaning after ``ESCAPE_CHAR`` in prompts and input values
bool is_escapable(char chr) {
    return chr == ESCAPE_CHAR || chr == '<' || chr == '>' || chr == COMMENT_CHAR || chr == FORCED_OUTPUT_MARKER[0];
}

/// Position of the first ``chr`` at or after ``from`` that is not escaped
std::optional<std::size_t> find_unescaped(std::string_view line, char chr, std::size_t from) {
    for (std::size_t i = from; i < line.size(); ++i) {
        if (line[i] == ESCAPE_CHAR && i + 1 < line.size()) {
            ++i;
            continue;
        }
        if (line[i] == chr) {
            return i;
        }
    }

    return std::nullopt;
}

/// Position of the first '<' that is not escaped, and has a closing '>' after it
std::optional<std::size_t> find_input_open(std::string_view line, std::size_t from) {
    auto open = find_unescaped(line, '<', from);

    if (open && find_unescaped(line, '>', *open + 1)) {
        return open;
    }

    return std::nullopt;
}

std::string unescape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == ESCAPE_CHAR && i + 1 < text.size() && is_escapable(text[i + 1])) {
            ++i;
        }
        result += text[i];
    }

    return result;
}

class TestCaseBuilder
{
public:
    void add_output_line(std::string_view line) {
        if (pending_output_) {
            *pending_output_ += '\n';
            *pending_output_ += line;
        } else {
            pending_output_ = std::string{line};
        }
    }

    void add_input(std::string prompt, std::string value) {
        flush_output();
        test_case_.expected.push_back(Interaction::prompt(std::move(prompt)));
        test_case_.expected.push_back(Interaction::input(std::move(value)));
    }

    bool empty() const { return test_case_.expected.empty() && !pending_output_; }

    TestCase finish() {
        flush_output();
        return std::exchange(test_case_, {});
    }

private:
    void flush_output() {
        if (pending_output_) {
            test_case_.expected.push_back(Interaction::output(std::move(*pending_output_)));
            pending_output_.reset();
        }
    }

    TestCase test_case_;
    std::optional<std::string> pending_output_;
};

void parse_line(std::string_view line, TestCaseBuilder& builder) {
    if (line.starts_with(FORCED_OUTPUT_MARKER)) {
        line.remove_prefix(FORCED_OUTPUT_MARKER.size());
        if (line.starts_with(' ')) {
            line.remove_prefix(1);
        }
        builder.add_output_line(line);
        return;
    }

    std::size_t cursor = 0;
    bool had_input = false;

    while (auto open = find_input_open(line, cursor)) {
        auto close = *find_unescaped(line, '>', *open + 1);

        builder.add_input(unescape(line.substr(cursor, *open - cursor)),
                          unescape(line.substr(*open + 1, close - *open - 1)));

        had_input = true;
        cursor = close + 1;
    }

    std::string_view rest = line.substr(cursor);

    if (!had_input || !rest.empty()) {
        builder.add_output_line(had_input ? rest : line);
    }
}

/// Whether an output line must be written with the forced-output marker to survive a round trip
bool needs_marker(std::string_view line) {
    return is_blank(line) || line.starts_with(COMMENT_CHAR) || line.starts_with(FORCED_OUTPUT_MARKER) ||
           line.find('<') != std::string_view::npos;
}

/// Escapes the characters delimiting inputs. At the start of a line, a leading comment or
/// forced-output marker is escaped as well
std::string escape(std::string_view text, bool at_line_start) {
    std::string result;
    result.reserve(text.size());

    if (at_line_start && (text.starts_with(COMMENT_CHAR) || text.starts_with(FORCED_OUTPUT_MARKER))) {
        result += ESCAPE_CHAR;
    }

    for (char chr : text) {
        if (chr == ESCAPE_CHAR || chr == '<' || chr == '>') {
            result += ESCAPE_CHAR;
        }
        result += chr;
    }

    return result;
}

} // namespace

std::vector<TestCase> parse(std::string_view text) {
    std::vector<TestCase> result;
    TestCaseBuilder builder;

    auto finish_block = [&] {
        if (!builder.empty()) {
            result.push_back(builder.finish());
        }
    };

    for (std::string_view line : split_lines(text)) {
        if (line.starts_with(COMMENT_CHAR)) {
            continue;
        }

        if (is_blank(line)) {
            finish_block();
            continue;
        }

        parse_line(line, builder);
    }

    finish_block();

    LOG_DEBUG("parsed {} test case(s)", result.size());

    return result;
}

std::string format(const Transcript& transcript) {
    std::string result;
    // Whether the current line already holds a prompt awaiting its input
    bool in_prompt = false;

    for (const Interaction& elem : transcript) {
        switch (elem.kind) {
        case InteractionKind::Prompt:
            result += escape(elem.text, !in_prompt);
            in_prompt = true;
            break;

        case InteractionKind::Input:
            result += fmt::format("<{}>\n", escape(elem.text, false));
            in_prompt = false;
            break;

        case InteractionKind::Output:
            if (in_prompt) {
                result += '\n';
                in_prompt = false;
            }
            for (std::string_view line : split_lines(elem.text)) {
                if (needs_marker(line)) {
                    result += fmt::format("{} {}\n", FORCED_OUTPUT_MARKER, line);
                } else {
                    result += line;
                    result += '\n';
                }
            }
            if (elem.text.empty() || elem.text.ends_with('\n')) {
                result += fmt::format("{}\n", FORCED_OUTPUT_MARKER);
            }
            break;
        }
    }

    if (in_prompt) {
        result += '\n';
    }

    return result;
}

std::string format(const std::vector<TestCase>& test_cases) {
    std::string result;

    for (const TestCase& test_case : test_cases) {
        if (!result.empty()) {
            result += '\n';
        }
        result += format(test_case.expected);
    }

    return result;
}

} // namespace iojudge::iospec
