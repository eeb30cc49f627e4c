// tests/harness.hpp
// Tiny test harness: each test executable is a plain main() that calls
// test functions and returns summary().
//
//   void testSomething() {
//     TEST("something")
//       ASSERT(1 + 1 == 2);
//     PASS()
//   }

#pragma once
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

inline int passed = 0, failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try {
#define PASS()                                                                 \
  std::cout << "PASS" << std::endl;                                            \
  ++passed;                                                                    \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    std::cout << "FAIL: " << e.what() << std::endl;                            \
    ++failed;                                                                  \
  }
#define ASSERT(cond)                                                           \
  if (!(cond))                                                                 \
  throw std::runtime_error(std::string(#cond) + " (line " +                    \
                           std::to_string(__LINE__) + ")")

// Asserts that `expr` throws an exception of type `type`.
#define ASSERT_THROWS(expr, type)                                              \
  do {                                                                         \
    bool threw_ = false;                                                       \
    try {                                                                      \
      expr;                                                                    \
    } catch (const type &) {                                                   \
      threw_ = true;                                                           \
    }                                                                          \
    if (!threw_)                                                               \
      throw std::runtime_error(std::string(#expr) + " did not throw " #type);  \
  } while (0)

inline int summary() {
  std::cout << "\n=== Summary ===" << std::endl;
  std::cout << "Passed: " << passed << std::endl;
  std::cout << "Failed: " << failed << std::endl;
  return failed > 0 ? 1 : 0;
}

// A fresh directory under the system temp dir, removed again on scope exit.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("midirec_" + tag + "_" + std::to_string(stamp) + "_" +
             std::to_string(std::rand()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ignored;
    std::filesystem::remove_all(path_, ignored);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};
