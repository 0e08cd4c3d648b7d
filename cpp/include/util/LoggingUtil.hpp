#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// Logging macros: LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN(), and LOG_ERROR().
//
// Messages use {}-style format strings:
//
// LOG_INFO("Seeded {} games", n);
// LOG_DEBUG("draw={} rank={}", draw, rank);
//
// LOG_TRACE() and LOG_DEBUG() statements are compiled out unless the build is configured with
// -DENABLE_DEBUG_LOGGING=ON. On top of that, --log-level filters at runtime.

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  /*
   * Installs a stdout sink, plus a file sink if params.log_filename is set.
   *
   * Throws util::CleanException if params.log_level is not a valid spdlog level name.
   */
  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
