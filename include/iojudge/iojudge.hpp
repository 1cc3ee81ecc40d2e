#pragma once

// IWYU pragma: begin_exports
#include <iojudge/build/build_manager.hpp>
#include <iojudge/common/error_types.hpp>
#include <iojudge/common/expected.hpp>
#include <iojudge/exceptions.hpp>
#include <iojudge/execution/execution_manager.hpp>
#include <iojudge/execution/execution_result.hpp>
#include <iojudge/grading/grader.hpp>
#include <iojudge/grading/verdict.hpp>
#include <iojudge/interaction/interaction.hpp>
#include <iojudge/interaction/iospec.hpp>
#include <iojudge/judge.hpp>
#include <iojudge/langs/builtin_languages.hpp>
#include <iojudge/registrars/auto_registrars.hpp>
#include <iojudge/registrars/language_registry.hpp>
#include <iojudge/subprocess/sandbox.hpp>
// IWYU pragma: end_exports
