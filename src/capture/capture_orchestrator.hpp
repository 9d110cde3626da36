#pragma once

#include "backends/camera_device.hpp"
#include "capture/device_prober.hpp"
#include "config/capture_config.hpp"
#include "core/errors/capture_error.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace camshot::core::logging {
class Logger;
}

namespace camshot::capture {

enum class CaptureState {
  kIdle = 0,
  kProbingDevice,
  kValidating,
  kCapturingFrame,
  kEncoding,
  kVerifying,
  kSucceeded,
  kExhausted,
  kAborted,
  kInterrupted,
};

const char* ToString(CaptureState state);

struct StateTransition {
  CaptureState state = CaptureState::kIdle;
  std::optional<std::size_t> device_index;
};

// Terminal outcome of one run.
struct CaptureResult {
  bool success = false;
  std::optional<std::size_t> device_index;
  std::optional<std::filesystem::path> file_path;
  std::uintmax_t file_size_bytes = 0U;
  std::uint32_t devices_tried = 0U;
  // Resource exhaustion stopped the run before all indices were tried.
  bool fatal = false;
  bool interrupted = false;
  // Set for unsuccessful runs: `kNoDeviceFound` after exhausting indices,
  // `kResourceExhaustion` for fatal aborts.
  std::optional<core::errors::CaptureErrorCode> error_code;
  std::string error;
};

// Supplies the output filename for a captured frame. Must return a bare name
// (no directory components).
using FilenameSource = std::function<std::string()>;

// Drives the per-device state machine:
//
//   Idle -> ProbingDevice(i) -> Validating -> CapturingFrame -> Encoding
//        -> Verifying -> Succeeded
//
// Any per-device failure releases the device and moves to ProbingDevice(i+1);
// the run ends in Exhausted after the last index. Out-of-memory moves straight
// to Aborted. A raised stop flag ends the run in Interrupted after releasing
// the open device. At most one device is open at any time.
class CaptureOrchestrator {
public:
  CaptureOrchestrator(config::CaptureConfig config, backends::ICameraDriver& driver,
                      backends::IFrameWriter& writer, FilenameSource filename_source,
                      core::logging::Logger& logger);

  // Optional flag polled between steps and before each read attempt; typically
  // raised by a signal handler.
  void SetStopFlag(const std::atomic<bool>* stop_requested);

  // Runs one capture. Never throws; every failure is folded into the result.
  CaptureResult Run();

  const std::vector<StateTransition>& transitions() const;
  std::uint32_t open_attempts() const;

private:
  enum class CycleOutcome {
    kSucceeded,
    kAdvance,
    kInterrupted,
  };

  CycleOutcome RunDeviceCycle(std::size_t index, CaptureResult& result);
  bool PersistFrame(std::size_t index, const backends::FrameSample& frame,
                    CaptureResult& result);
  bool VerifyPersistedFile(std::size_t index, const std::filesystem::path& path,
                           std::uintmax_t& size_bytes);
  void DiscardRejectedFile(const std::filesystem::path& path);
  void EnterState(CaptureState state, std::optional<std::size_t> device_index = std::nullopt);
  bool StopRequested() const;
  CycleOutcome Interrupt(DeviceLease& lease, std::size_t index, CaptureResult& result);

  config::CaptureConfig config_;
  backends::IFrameWriter& writer_;
  FilenameSource filename_source_;
  core::logging::Logger& logger_;
  DeviceProber prober_;
  const std::atomic<bool>* stop_requested_ = nullptr;
  std::vector<StateTransition> transitions_;
};

} // namespace camshot::capture
