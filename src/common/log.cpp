// src/common/log.cpp
// Sinks for the blog:: loggers: stdout always, one optional append-mode file.

#include "common/log.hpp"

#include <atomic>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <fmt/chrono.h>

namespace {

std::mutex g_sinkMutex; // guards both sinks so lines never interleave
std::ofstream g_file;
std::atomic<bool> g_verbose{false};

std::string_view level_tag(blog::Level level) {
  switch (level) {
  case blog::Level::Debug:
    return "dbg ";
  case blog::Level::Error:
    return "ERR ";
  case blog::Level::Info:
    break;
  }
  return "";
}

} // namespace

namespace blog {

void configure(const std::filesystem::path &logFile, bool verbose) {
  g_verbose.store(verbose, std::memory_order_relaxed);
  if (logFile.empty())
    return;

  if (logFile.has_parent_path()) {
    std::filesystem::create_directories(logFile.parent_path());
  }

  std::lock_guard<std::mutex> lock(g_sinkMutex);
  g_file.close();
  g_file.open(logFile, std::ios::app);
  if (!g_file) {
    throw std::runtime_error("Could not open log file: " + logFile.string());
  }
}

void set_verbose(bool verbose) {
  g_verbose.store(verbose, std::memory_order_relaxed);
}

namespace detail {

bool enabled(Level level) {
  return level != Level::Debug || g_verbose.load(std::memory_order_relaxed);
}

void emit(Level level, std::string_view prefix, std::string_view message) {
  const std::string line =
      fmt::format("{:%Y-%m-%d %H:%M:%S} {} | {}{}\n",
                  fmt::localtime(std::time(nullptr)), prefix, level_tag(level),
                  message);

  std::lock_guard<std::mutex> lock(g_sinkMutex);
  std::cout << line << std::flush;
  if (g_file.is_open()) {
    g_file << line << std::flush;
  }
}

} // namespace detail
} // namespace blog
