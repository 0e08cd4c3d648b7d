#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <format>
#include <source_location>

/*
 * Assert macros that throw instead of aborting:
 *
 * - DEBUG_ASSERT() - throws util::DebugAssertionError; only checked when DEBUG_BUILD is defined
 *   to 1 (cmake -DCMAKE_BUILD_TYPE=Debug).
 *
 * - RELEASE_ASSERT() - throws util::ReleaseAssertionError; always checked.
 *
 * - CLEAN_ASSERT() - throws util::CleanAssertionError; always checked. Use this for conditions
 *   that depend on user input. See util::CleanException.
 *
 * Each variant accepts either a single bool, or a bool followed by a format string and its
 * arguments:
 *
 * RELEASE_ASSERT(rank < kNumGameRanks, "bad rank {}", rank);
 *
 * Unlike assert(), a disabled DEBUG_ASSERT() still compiles its arguments, but does not evaluate
 * them.
 */

#define DEBUG_ASSERT(COND, ...)                                                                    \
  do {                                                                                             \
    if (IS_MACRO_ENABLED(DEBUG_BUILD)) {                                                           \
      util::detail::assert_impl<util::DebugAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
    }                                                                                              \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                                                  \
  do {                                                                                             \
    util::detail::assert_impl<util::ReleaseAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                                                  \
  do {                                                                                           \
    util::detail::assert_impl<util::CleanAssertionError>(#COND, std::source_location::current(), \
                                                         COND, ##__VA_ARGS__);                   \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
inline void assert_impl([[maybe_unused]] const char* cond_str, const std::source_location& loc,
                        bool cond, const std::format_string<Ts...>& fmt, Ts&&... ts) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(),
                     std::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
  }
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), cond_str, loc.file_name(),
                     loc.line());
  }
}

}  // namespace detail
}  // namespace util
