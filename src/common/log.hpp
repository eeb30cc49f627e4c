// src/common/log.hpp
// Per-subsystem loggers on top of {fmt}.
//
//   blog::rec("Saved recording to {}", path.string());
//   blog::error::port("could not open {} ({})", name, err.what());
//   blog::debug::rec("buffered tap {} on note {}", count, note);
//
// Every line is "<local time> <SUBSYS> | <message>" and goes to stdout, plus
// the log file when one was configured. Debug lines only appear when verbose
// logging is on. Safe to call from any thread.

#pragma once
#include <filesystem>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace blog {

enum class Level { Debug, Info, Error };

// Open (append) an additional log file and set the verbosity. Throws
// std::runtime_error if the file cannot be opened.
void configure(const std::filesystem::path &logFile, bool verbose);
void set_verbose(bool verbose);

namespace detail {

bool enabled(Level level);
void emit(Level level, std::string_view prefix, std::string_view message);

template <typename... Args>
void print(Level level, std::string_view prefix,
           fmt::format_string<Args...> format, Args &&...args) {
  if (!enabled(level))
    return;
  emit(level, prefix, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace detail

#define ADD_BLOG(_name, _prefix)                                               \
  template <typename... Args>                                                  \
  void _name(fmt::format_string<Args...> format, Args &&...args) {             \
    detail::print(Level::Info, _prefix, format, std::forward<Args>(args)...);  \
  }                                                                            \
  namespace error {                                                            \
  template <typename... Args>                                                  \
  void _name(fmt::format_string<Args...> format, Args &&...args) {             \
    detail::print(Level::Error, _prefix, format, std::forward<Args>(args)...); \
  }                                                                            \
  }                                                                            \
  namespace debug {                                                            \
  template <typename... Args>                                                  \
  void _name(fmt::format_string<Args...> format, Args &&...args) {             \
    detail::print(Level::Debug, _prefix, format, std::forward<Args>(args)...); \
  }                                                                            \
  }

ADD_BLOG(app, " APP")
ADD_BLOG(rec, " REC")
ADD_BLOG(port, "PORT")
ADD_BLOG(power, " PWR")

#undef ADD_BLOG

} // namespace blog
