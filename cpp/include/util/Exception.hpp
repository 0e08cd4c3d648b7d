#pragma once

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace util {

/*
 * std::exception with std::format() mechanics:
 *
 * throw util::Exception("rank {} out of range [0, {})", rank, limit);
 */
class Exception : public std::exception {
 public:
  Exception() : std::exception() {}

  template <typename... Ts>
  Exception(std::format_string<Ts...> fmt, Ts&&... ts) : std::exception() {
    what_ = std::format(fmt, std::forward<Ts>(ts)...);
  }
  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Thrown for failures that are the user's fault rather than the program's: a malformed config
 * file, a seed game outside the configured range, an unreadable CSV, etc.
 *
 * main() catches these and prints the message to stderr instead of letting the process die with
 * an uncaught exception (and a core dump). Anything that indicates a bug should throw a plain
 * util::Exception instead.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Used for DEBUG_ASSERT() statements.
class DebugAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
  using Exception::Exception;
};

// Used for RELEASE_ASSERT() statements.
class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
  using Exception::Exception;
};

// Used for CLEAN_ASSERT() statements.
class CleanAssertionError : public CleanException {
 public:
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
  using CleanException::CleanException;
};

}  // namespace util
