#include "camshot/cli/router.hpp"

#include "artifacts/capture_filename.hpp"
#include "backends/webcam/opencv_bootstrap.hpp"
#include "backends/webcam/opencv_camera_driver.hpp"
#include "backends/webcam/opencv_frame_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace camshot::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInterrupted = core::errors::ToInt(core::errors::ExitCode::kInterrupted);
constexpr int kExitResourceExhausted =
    core::errors::ToInt(core::errors::ExitCode::kResourceExhausted);

constexpr std::string_view kLogFileName = "capture_log.txt";

static_assert(std::atomic<bool>::is_always_lock_free,
              "signal handler requires a lock-free stop flag");

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signal_number*/) {
  g_stop_requested.store(true);
}

// Installs SIGINT/SIGTERM handlers for the lifetime of one capture and puts
// the previous handlers back afterwards, so embedding callers keep theirs.
class ScopedStopSignals {
public:
  ScopedStopSignals() {
    g_stop_requested.store(false);
    previous_int_ = std::signal(SIGINT, HandleStopSignal);
    previous_term_ = std::signal(SIGTERM, HandleStopSignal);
  }

  ~ScopedStopSignals() {
    if (previous_int_ != SIG_ERR) {
      (void)std::signal(SIGINT, previous_int_);
    }
    if (previous_term_ != SIG_ERR) {
      (void)std::signal(SIGTERM, previous_term_);
    }
  }

  ScopedStopSignals(const ScopedStopSignals&) = delete;
  ScopedStopSignals& operator=(const ScopedStopSignals&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_int_ = SIG_ERR;
  Handler previous_term_ = SIG_ERR;
};

// Shared by help and by usage errors.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camshot [capture] [--output <dir>] [--max-devices <n>] [--attempts <n>] "
         "[--quality <1-100>] [--min-bytes <n>] "
         "[--log-level <debug|info|success|warn|error>]\n"
      << "  camshot version\n"
      << "  camshot help\n";
}

void PrintRemediationHints(std::ostream& out) {
  out << "possible solutions:\n"
      << "  1. check that a camera is connected and powered\n"
      << "  2. close other applications that may be using the camera\n"
      << "  3. check camera permissions (video group, OS privacy settings) or run with "
         "sufficient privileges\n"
      << "  4. make sure this build includes OpenCV camera support\n";
  if (!backends::webcam::IsOpenCvBootstrapEnabled()) {
    out << "     (this binary was built without OpenCV; rebuild with OpenCV videoio and "
           "imgcodecs installed)\n";
  }
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& value,
                   std::string& error) {
  if (raw.empty()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  std::uint64_t parsed = 0U;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  value = parsed;
  return true;
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args,
                         config::CaptureConfig& config, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool takes_value = token == "--output" || token == "--max-devices" ||
                             token == "--attempts" || token == "--quality" ||
                             token == "--min-bytes" || token == "--log-level";
    if (!takes_value) {
      if (!token.empty() && token.front() == '-') {
        error = "unknown option: " + std::string(token);
      } else {
        error = "unexpected argument: " + std::string(token);
      }
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--output") {
      if (value.empty()) {
        error = "--output cannot be empty";
        return false;
      }
      config.output_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      config.log_level = parsed;
      continue;
    }

    std::uint64_t number = 0U;
    if (!ParseUnsigned(token, value, number, error)) {
      return false;
    }
    if (token == "--max-devices") {
      if (number > config::kMaxDevicesLimit) {
        error = "--max-devices must be <= " + std::to_string(config::kMaxDevicesLimit);
        return false;
      }
      config.max_devices = static_cast<std::uint32_t>(number);
    } else if (token == "--attempts") {
      if (number > config::kMaxReadAttemptsLimit) {
        error = "--attempts must be <= " + std::to_string(config::kMaxReadAttemptsLimit);
        return false;
      }
      config.read_attempts = static_cast<std::uint32_t>(number);
    } else if (token == "--quality") {
      if (number > 100U) {
        error = "--quality must be in range [1, 100]";
        return false;
      }
      config.jpeg_quality = static_cast<int>(number);
    } else {
      config.min_file_bytes = static_cast<std::uintmax_t>(number);
    }
  }
  return true;
}

fs::path AbsoluteOrSelf(const fs::path& path) {
  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  return ec ? path : absolute.lexically_normal();
}

double SecondsSince(const std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at).count();
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camshot 0.1.0 (" << backends::webcam::OpenCvBootstrapDetail() << ")\n";
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  config::CaptureConfig config;
  std::string error;
  if (!ParseCaptureOptions(args, config, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  backends::webcam::OpenCvCameraDriver driver;
  backends::webcam::OpenCvFrameWriter writer;
  return ExecuteCapture(config, driver, writer, std::cout, nullptr);
}

} // namespace

int ExecuteCapture(const config::CaptureConfig& requested_config, backends::ICameraDriver& driver,
                   backends::IFrameWriter& writer, std::ostream& out,
                   CaptureRunSummary* summary) {
  const auto started_at = std::chrono::steady_clock::now();

  config::ValidationReport report;
  config::ValidateCaptureConfig(requested_config, report);
  if (!report.valid) {
    std::cerr << "invalid capture configuration:\n";
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    if (summary != nullptr) {
      summary->exit_code = kExitUsage;
    }
    return kExitUsage;
  }

  core::logging::Logger logger(requested_config.log_level, std::cerr);
  logger.SetRunId("capture-" + std::to_string(core::ToEpochMillis(std::chrono::system_clock::now())));

  config::CaptureConfig config = requested_config;
  const config::OutputDirResolution resolution =
      config::ResolveOutputDirectory(requested_config.output_dir);
  for (const auto& rejected : resolution.rejected) {
    logger.Warn("output directory candidate rejected", {{"reason", rejected}});
  }
  if (!resolution.verified) {
    logger.Warn("no writable output directory found, using it unverified",
                {{"output_dir", resolution.directory.string()}});
  } else if (resolution.used_fallback) {
    logger.Warn("using fallback output directory",
                {{"requested", requested_config.output_dir.string()},
                 {"output_dir", resolution.directory.string()}});
  }
  config.output_dir = resolution.directory;

  const fs::path log_path = config.output_dir / kLogFileName;
  std::string sink_error;
  if (logger.AttachFileSink(log_path, sink_error)) {
    logger.Info("log initialized", {{"log_file", log_path.string()}});
  } else {
    logger.Warn("cannot initialize log file, continuing with console logging",
                {{"error", sink_error}});
  }

  logger.Info("camera support", {{"opencv", backends::webcam::OpenCvBootstrapStatusText()}});

  const hostprobe::HostIdentity identity = hostprobe::ProbeHostIdentity();
  logger.Debug("host identity resolved", {{"hostname_source", identity.hostname_source},
                                          {"mac_source", identity.mac_source},
                                          {"username_source", identity.username_source}});

  out << "system information:\n"
      << "  hostname: " << identity.hostname << '\n'
      << "  mac: " << identity.mac << '\n'
      << "  user: " << identity.username << '\n'
      << "  output: " << AbsoluteOrSelf(config.output_dir).string() << '\n'
      << "  camera support: " << backends::webcam::OpenCvBootstrapDetail() << '\n';
  out.flush();

  capture::CaptureResult result;
  {
    ScopedStopSignals stop_signals;
    capture::CaptureOrchestrator orchestrator(
        config, driver, writer,
        [&identity]() {
          return artifacts::BuildCaptureFilename(identity, std::chrono::system_clock::now());
        },
        logger);
    orchestrator.SetStopFlag(&g_stop_requested);
    result = orchestrator.Run();
  }

  const double elapsed_s = SecondsSince(started_at);
  int exit_code = kExitFailure;
  out << std::fixed << std::setprecision(1);
  if (result.success && result.file_path.has_value()) {
    out << "success: captured " << result.file_path->string() << " ("
        << static_cast<double>(result.file_size_bytes) / 1024.0 << " KB) from camera "
        << result.device_index.value_or(0U) << " in " << elapsed_s << "s\n";
    exit_code = kExitSuccess;
  } else if (result.interrupted) {
    out << "interrupted: capture stopped by signal after " << elapsed_s << "s\n";
    exit_code = kExitInterrupted;
  } else if (result.fatal) {
    out << "critical: out of memory, capture aborted after " << elapsed_s << "s\n";
    exit_code = kExitResourceExhausted;
  } else {
    out << "failed: no capture after " << elapsed_s << "s (tried " << result.devices_tried
        << " camera indices)\n";
    PrintRemediationHints(out);
    exit_code = kExitFailure;
  }
  out.flush();

  if (summary != nullptr) {
    summary->result = result;
    summary->identity = identity;
    summary->output_dir = config.output_dir;
    summary->log_path = logger.HasFileSink() ? log_path : fs::path();
    summary->exit_code = exit_code;
  }
  logger.Info("capture run finished", {{"exit_code", std::to_string(exit_code)}});
  logger.DetachFileSink();
  return exit_code;
}

int Dispatch(int argc, char** argv) {
  try {
    const std::vector<std::string_view> all_args =
        argc > 1 ? std::vector<std::string_view>(argv + 1, argv + argc)
                 : std::vector<std::string_view>{};

    // Bare `camshot` and `camshot --output ...` both mean capture, so existing
    // scheduled-task command lines keep working.
    if (all_args.empty() || all_args.front().rfind("--", 0) == 0U) {
      if (!all_args.empty() && all_args.front() == "--help") {
        PrintUsage(std::cout);
        return kExitSuccess;
      }
      return CommandCapture(all_args);
    }

    const std::string_view command = all_args.front();
    const std::vector<std::string_view> args(all_args.begin() + 1, all_args.end());

    if (command == "capture") {
      return CommandCapture(args);
    }

    if (command == "version") {
      return CommandVersion(args);
    }

    if (command == "help" || command == "-h") {
      PrintUsage(std::cout);
      return kExitSuccess;
    }

    std::cerr << "error: unknown subcommand: " << command << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  } catch (const std::bad_alloc&) {
    std::cerr << "critical: out of memory\n";
    return kExitResourceExhausted;
  } catch (const std::exception& ex) {
    std::cerr << "unexpected failure: " << ex.what() << '\n';
    PrintRemediationHints(std::cerr);
    return kExitFailure;
  } catch (...) {
    std::cerr << "unexpected failure: non-standard exception\n";
    PrintRemediationHints(std::cerr);
    return kExitFailure;
  }
}

} // namespace camshot::cli
