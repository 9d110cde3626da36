#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace camshot::config {

constexpr std::uint32_t kDefaultMaxDevices = 5U;
constexpr std::uint32_t kDefaultReadAttempts = 3U;
constexpr int kDefaultJpegQuality = 85;
constexpr std::uintmax_t kDefaultMinFileBytes = 100U;

// Upper bounds keep a typo (`--max-devices 5000`) from turning one unattended
// run into a multi-minute probe of non-existent indices.
constexpr std::uint32_t kMaxDevicesLimit = 64U;
constexpr std::uint32_t kMaxReadAttemptsLimit = 20U;

// Read-only input for one capture run.
struct CaptureConfig {
  std::filesystem::path output_dir = "camshots";
  // Indices `0 .. max_devices-1` are probed in order.
  std::uint32_t max_devices = kDefaultMaxDevices;
  // Read attempts for both the validation read and the authoritative read.
  std::uint32_t read_attempts = kDefaultReadAttempts;
  std::chrono::milliseconds validation_retry_delay{100};
  std::chrono::milliseconds capture_retry_delay{50};
  // Pause between a successful validation and the authoritative read.
  std::chrono::milliseconds settle_delay{100};
  // Pause before the final existence re-check of a verified file.
  std::chrono::milliseconds verify_settle_delay{100};
  int jpeg_quality = kDefaultJpegQuality;
  // A written file must be strictly larger than this to count as captured.
  std::uintmax_t min_file_bytes = kDefaultMinFileBytes;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Checks field ranges. Populates `report.valid` and `report.issues`; never
// touches the filesystem.
void ValidateCaptureConfig(const CaptureConfig& config, ValidationReport& report);

struct OutputDirResolution {
  std::filesystem::path directory;
  // False when every candidate failed. `directory` is then the system temp
  // directory, or the requested path when no temp directory is known.
  bool verified = false;
  bool used_fallback = false;
  // Failure text per rejected candidate, in probe order.
  std::vector<std::string> rejected;
};

// Picks the first writable directory from the requested path, the current
// directory and the system temp directory. When none passes the write check
// the temp directory is used anyway and the image write reports any error.
OutputDirResolution ResolveOutputDirectory(const std::filesystem::path& requested);

// `ResolveOutputDirectory` with explicit working and temp directories. An
// empty `temp_dir` means none is available.
OutputDirResolution SelectOutputDirectory(const std::filesystem::path& requested,
                                          const std::filesystem::path& working_dir,
                                          const std::filesystem::path& temp_dir);

} // namespace camshot::config
