#ifndef BENCHTEL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define BENCHTEL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <filesystem>
#include <string>
#include <system_error>

namespace benchtel::artifacts {

// Shared output-dir creation guard so every writer reports the same error text.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace benchtel::artifacts

#endif // BENCHTEL_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
