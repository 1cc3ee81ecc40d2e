#pragma once

#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace iojudge {

inline void trace_exception(const std::exception& exception) {
    std::string except_str = fmt::format("Unhandled exception: {}", exception.what());
    fmt::print(stderr, "{}\n{}\n", except_str, std::string(except_str.size(), '='));
}

/// Invokes `fn`, reporting any escaping std::exception on stderr.
/// Returns nullopt if `fn` threw.
template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...>)
std::optional<std::invoke_result_t<Func, Args...>> wrap_throwable_fn(Func&& fn, Args&&... args) {
    try {
        return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        trace_exception(ex);
    }

    return std::nullopt;
}

} // namespace iojudge
