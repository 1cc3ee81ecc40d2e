#pragma once

#include <iojudge/common/error_types.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace iojudge {

/// Base for every failure of the judging pipeline that is not an outcome of the judged program
class JudgeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The identifier did not resolve to any registered language
class UnknownLanguageError : public JudgeError
{
public:
    explicit UnknownLanguageError(std::string identifier)
        : JudgeError{fmt::format("unknown language: '{}'", identifier)}
        , identifier_{std::move(identifier)} {}

    const std::string& get_identifier() const { return identifier_; }

private:
    std::string identifier_;
};

/// A strict registration collided with an existing key, alias or extension
class ConflictError : public JudgeError
{
public:
    using JudgeError::JudgeError;
};

/// Compiler invocation failed. Carries the captured compiler output
class BuildError : public JudgeError
{
public:
    explicit BuildError(std::string output, const std::string& msg = "build failed")
        : JudgeError{msg}
        , output_{std::move(output)} {}

    const std::string& get_output() const { return output_; }

private:
    std::string output_;
};

/// Static syntax check failed; no execution was attempted
class SyntaxError : public BuildError
{
public:
    explicit SyntaxError(std::string output)
        : BuildError{std::move(output), "syntax check failed"} {}
};

/// The isolation layer could not launch or supervise a process
class SandboxError : public JudgeError
{
public:
    explicit SandboxError(ErrorKind error, const std::string& msg = "")
        : JudgeError{msg.empty() ? fmt::format("sandbox failure ({})", error)
                                 : fmt::format("{} ({})", msg, error)}
        , error_{error} {}

    ErrorKind get_error() const { return error_; }

private:
    ErrorKind error_ = ErrorKind::UnknownError;
};

/// An invariant of the judge itself was violated. Never converted into a verdict
class InternalError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace iojudge
