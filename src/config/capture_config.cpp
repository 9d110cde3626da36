#include "config/capture_config.hpp"

#include "core/fs_utils.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace camshot::config {

namespace {

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void ValidateDelay(ValidationReport& report, const char* path,
                   const std::chrono::milliseconds value) {
  if (value < std::chrono::milliseconds::zero()) {
    AddIssue(report, path, "must be >= 0 ms");
  }
}

} // namespace

void ValidateCaptureConfig(const CaptureConfig& config, ValidationReport& report) {
  report = ValidationReport{};

  if (config.output_dir.empty()) {
    AddIssue(report, "output_dir", "must not be empty");
  }
  if (config.max_devices == 0U || config.max_devices > kMaxDevicesLimit) {
    AddIssue(report, "max_devices",
             "must be in range [1, " + std::to_string(kMaxDevicesLimit) + "]");
  }
  if (config.read_attempts == 0U || config.read_attempts > kMaxReadAttemptsLimit) {
    AddIssue(report, "read_attempts",
             "must be in range [1, " + std::to_string(kMaxReadAttemptsLimit) + "]");
  }
  if (config.jpeg_quality < 1 || config.jpeg_quality > 100) {
    AddIssue(report, "jpeg_quality", "must be in range [1, 100]");
  }
  ValidateDelay(report, "validation_retry_delay", config.validation_retry_delay);
  ValidateDelay(report, "capture_retry_delay", config.capture_retry_delay);
  ValidateDelay(report, "settle_delay", config.settle_delay);
  ValidateDelay(report, "verify_settle_delay", config.verify_settle_delay);

  report.valid = report.issues.empty();
}

OutputDirResolution ResolveOutputDirectory(const fs::path& requested) {
  std::error_code temp_ec;
  const fs::path temp_dir = fs::temp_directory_path(temp_ec);
  OutputDirResolution resolution =
      SelectOutputDirectory(requested, fs::path("."), temp_ec ? fs::path() : temp_dir);
  if (temp_ec) {
    resolution.rejected.push_back("system temp directory unavailable: " + temp_ec.message());
  }
  return resolution;
}

OutputDirResolution SelectOutputDirectory(const fs::path& requested, const fs::path& working_dir,
                                          const fs::path& temp_dir) {
  OutputDirResolution resolution;

  std::vector<fs::path> candidates;
  if (!requested.empty()) {
    candidates.push_back(requested);
  }
  candidates.push_back(working_dir);
  if (!temp_dir.empty()) {
    candidates.push_back(temp_dir);
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    std::string error;
    if (core::ProbeDirectoryWritable(candidates[i], error)) {
      resolution.directory = candidates[i];
      resolution.verified = true;
      resolution.used_fallback = requested.empty() || i != 0U;
      return resolution;
    }
    resolution.rejected.push_back(std::move(error));
  }

  if (!temp_dir.empty()) {
    resolution.directory = temp_dir;
    resolution.used_fallback = true;
  } else {
    resolution.directory = requested.empty() ? working_dir : requested;
    resolution.used_fallback = requested.empty();
  }
  resolution.verified = false;
  return resolution;
}

} // namespace camshot::config
