#ifndef BENCHTEL_TESTS_COMMON_ASSERTIONS_HPP_
#define BENCHTEL_TESTS_COMMON_ASSERTIONS_HPP_

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace benchtel::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertTrue(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNear(double actual, double expected, double tolerance, std::string_view what) {
  if (std::fabs(actual - expected) <= tolerance) {
    return;
  }
  std::cerr << what << ": expected " << expected << " +/- " << tolerance << ", got " << actual
            << '\n';
  std::abort();
}

inline void AssertExitCode(int actual, int expected, std::string_view what) {
  if (actual == expected) {
    return;
  }
  std::cerr << what << ": expected exit code " << expected << ", got " << actual << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& path, std::string_view contents) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open file for writing: " + path.string());
  }
  output << contents;
  if (!output) {
    Fail("failed to write file: " + path.string());
  }
}

} // namespace benchtel::tests::common

#endif // BENCHTEL_TESTS_COMMON_ASSERTIONS_HPP_
