#pragma once

#include "backends/camera_device.hpp"
#include "capture/capture_orchestrator.hpp"
#include "config/capture_config.hpp"
#include "hostprobe/identity_probe.hpp"

#include <filesystem>
#include <iosfwd>

namespace camshot::cli {

// Outputs of one in-process capture run, for callers that need more than the
// exit code (tests, wrappers).
struct CaptureRunSummary {
  capture::CaptureResult result;
  hostprobe::HostIdentity identity;
  std::filesystem::path output_dir;
  std::filesystem::path log_path;
  int exit_code = 1;
};

// Runs the full capture flow (output-dir resolution, log file, identity probe,
// orchestrator, outcome report) with caller-provided device seams. Operator
// text goes to `out`; structured log lines go to stderr and the log file.
int ExecuteCapture(const config::CaptureConfig& config, backends::ICameraDriver& driver,
                   backends::IFrameWriter& writer, std::ostream& out,
                   CaptureRunSummary* summary);

// Routes `camshot` commands and returns process exit codes:
//   0   => image captured and verified
//   1   => no image captured / unexpected failure
//   2   => usage error (unknown command / invalid args)
//   130 => interrupted by signal
//   137 => out of memory
int Dispatch(int argc, char** argv);

} // namespace camshot::cli
