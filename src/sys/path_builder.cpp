// src/sys/path_builder.cpp

#include "sys/path_builder.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace sys {

CalendarPathBuilder::CalendarPathBuilder(std::filesystem::path base)
    : base_(std::move(base)) {}

std::filesystem::path
CalendarPathBuilder::session_path(capture::WallTime start,
                                  const std::string &suffix) {
  const std::tm local =
      fmt::localtime(std::chrono::system_clock::to_time_t(start));

  const std::filesystem::path dir = base_ / fmt::format("{:%Y}", local) /
                                    fmt::format("{:%m-%B}", local) /
                                    fmt::format("{:%d}", local);
  std::filesystem::create_directories(dir);

  const std::string stem = fmt::format("session_{:%H%M%S}", local);
  std::filesystem::path path = dir / fmt::format("{}{}.mid", stem, suffix);
  for (int n = 2; std::filesystem::exists(path); ++n) {
    path = dir / fmt::format("{}_{}{}.mid", stem, n, suffix);
  }
  return path;
}

} // namespace sys
