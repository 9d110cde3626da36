#include "config/capture_config.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

using camshot::config::CaptureConfig;
using camshot::config::ValidationReport;

namespace {

bool HasIssueFor(const ValidationReport& report, const std::string& path) {
  for (const auto& issue : report.issues) {
    if (issue.path == path) {
      return true;
    }
  }
  return false;
}

fs::path UniqueDir(const char* stem) {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return fs::temp_directory_path() / (std::string(stem) + "-" + std::to_string(now_ms));
}

} // namespace

TEST_CASE("Default capture config is valid", "[config]") {
  const CaptureConfig config;
  ValidationReport report;
  camshot::config::ValidateCaptureConfig(config, report);

  REQUIRE(report.valid);
  REQUIRE(report.issues.empty());
  REQUIRE(config.output_dir.string() == "camshots");
  REQUIRE(config.max_devices == 5U);
  REQUIRE(config.read_attempts == 3U);
  REQUIRE(config.jpeg_quality == 85);
  REQUIRE(config.min_file_bytes == 100U);
}

TEST_CASE("Out-of-range fields are reported with their paths", "[config]") {
  CaptureConfig config;
  config.output_dir.clear();
  config.max_devices = 0U;
  config.read_attempts = camshot::config::kMaxReadAttemptsLimit + 1U;
  config.jpeg_quality = 101;
  config.settle_delay = std::chrono::milliseconds(-1);

  ValidationReport report;
  camshot::config::ValidateCaptureConfig(config, report);

  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.size() == 5U);
  REQUIRE(HasIssueFor(report, "output_dir"));
  REQUIRE(HasIssueFor(report, "max_devices"));
  REQUIRE(HasIssueFor(report, "read_attempts"));
  REQUIRE(HasIssueFor(report, "jpeg_quality"));
  REQUIRE(HasIssueFor(report, "settle_delay"));
}

TEST_CASE("Device count above the limit is rejected", "[config]") {
  CaptureConfig config;
  config.max_devices = camshot::config::kMaxDevicesLimit + 1U;

  ValidationReport report;
  camshot::config::ValidateCaptureConfig(config, report);

  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssueFor(report, "max_devices"));
}

TEST_CASE("Writable requested output directory is used directly", "[config][output]") {
  const fs::path requested = UniqueDir("camshot-config-out") / "shots";

  const auto resolution = camshot::config::ResolveOutputDirectory(requested);

  REQUIRE(resolution.verified);
  REQUIRE_FALSE(resolution.used_fallback);
  REQUIRE(resolution.directory.string() == requested.string());
  REQUIRE(fs::is_directory(requested));
  REQUIRE_FALSE(fs::exists(requested / ".write_test"));

  std::error_code ec;
  fs::remove_all(requested.parent_path(), ec);
}

TEST_CASE("Unusable requested output directory falls back", "[config][output]") {
  const fs::path root = UniqueDir("camshot-config-blocked");
  std::error_code ec;
  fs::create_directories(root, ec);
  REQUIRE_FALSE(ec);

  // A regular file where the directory should be cannot become a directory.
  const fs::path blocker = root / "not_a_dir";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  const auto resolution = camshot::config::ResolveOutputDirectory(blocker);

  REQUIRE(resolution.verified);
  REQUIRE(resolution.used_fallback);
  REQUIRE(resolution.directory.string() != blocker.string());
  REQUIRE_FALSE(resolution.rejected.empty());

  fs::remove_all(root, ec);
}

TEST_CASE("Output directory uses temp directory unverified when every candidate fails",
          "[config][output]") {
  const fs::path root = UniqueDir("camshot-config-all-blocked");
  std::error_code ec;
  fs::create_directories(root, ec);
  REQUIRE_FALSE(ec);

  const fs::path requested = root / "requested";
  const fs::path working = root / "working";
  const fs::path temp = root / "temp";
  for (const fs::path& blocker : {requested, working, temp}) {
    std::ofstream out(blocker);
    out << "x";
  }

  const auto resolution = camshot::config::SelectOutputDirectory(requested, working, temp);

  REQUIRE_FALSE(resolution.verified);
  REQUIRE(resolution.used_fallback);
  REQUIRE(resolution.directory.string() == temp.string());
  REQUIRE(resolution.rejected.size() == 3U);

  fs::remove_all(root, ec);
}

TEST_CASE("Output directory keeps requested path when no temp directory is known",
          "[config][output]") {
  const fs::path root = UniqueDir("camshot-config-no-temp");
  std::error_code ec;
  fs::create_directories(root, ec);
  REQUIRE_FALSE(ec);

  const fs::path requested = root / "requested";
  const fs::path working = root / "working";
  for (const fs::path& blocker : {requested, working}) {
    std::ofstream out(blocker);
    out << "x";
  }

  const auto resolution = camshot::config::SelectOutputDirectory(requested, working, fs::path());

  REQUIRE_FALSE(resolution.verified);
  REQUIRE_FALSE(resolution.used_fallback);
  REQUIRE(resolution.directory.string() == requested.string());
  REQUIRE(resolution.rejected.size() == 2U);

  fs::remove_all(root, ec);
}
