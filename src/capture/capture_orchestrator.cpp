#include "capture/capture_orchestrator.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <exception>
#include <iomanip>
#include <new>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace camshot::capture {

namespace {

using core::errors::CaptureErrorCode;
using core::errors::ToStableErrorCode;

void Pause(const std::chrono::milliseconds delay) {
  if (delay > std::chrono::milliseconds::zero()) {
    std::this_thread::sleep_for(delay);
  }
}

std::string FormatKilobytes(const std::uintmax_t bytes) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0;
  return out.str();
}

fs::path AbsoluteOrSelf(const fs::path& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return path;
  }
  return absolute.lexically_normal();
}

} // namespace

const char* ToString(const CaptureState state) {
  switch (state) {
  case CaptureState::kIdle:
    return "idle";
  case CaptureState::kProbingDevice:
    return "probing_device";
  case CaptureState::kValidating:
    return "validating";
  case CaptureState::kCapturingFrame:
    return "capturing_frame";
  case CaptureState::kEncoding:
    return "encoding";
  case CaptureState::kVerifying:
    return "verifying";
  case CaptureState::kSucceeded:
    return "succeeded";
  case CaptureState::kExhausted:
    return "exhausted";
  case CaptureState::kAborted:
    return "aborted";
  case CaptureState::kInterrupted:
    return "interrupted";
  }
  return "unknown";
}

CaptureOrchestrator::CaptureOrchestrator(config::CaptureConfig config,
                                         backends::ICameraDriver& driver,
                                         backends::IFrameWriter& writer,
                                         FilenameSource filename_source,
                                         core::logging::Logger& logger)
    : config_(std::move(config)), writer_(writer), filename_source_(std::move(filename_source)),
      logger_(logger), prober_(driver, logger) {}

void CaptureOrchestrator::SetStopFlag(const std::atomic<bool>* stop_requested) {
  stop_requested_ = stop_requested;
  prober_.SetStopFlag(stop_requested);
}

const std::vector<StateTransition>& CaptureOrchestrator::transitions() const {
  return transitions_;
}

std::uint32_t CaptureOrchestrator::open_attempts() const {
  return prober_.open_attempts();
}

bool CaptureOrchestrator::StopRequested() const {
  return stop_requested_ != nullptr && stop_requested_->load();
}

void CaptureOrchestrator::EnterState(const CaptureState state,
                                     const std::optional<std::size_t> device_index) {
  transitions_.push_back({.state = state, .device_index = device_index});
  logger_.Debug("capture state", {{"state", ToString(state)},
                                  {"device_index", device_index.has_value()
                                                       ? std::to_string(device_index.value())
                                                       : std::string("-")}});
}

CaptureResult CaptureOrchestrator::Run() {
  CaptureResult result;
  std::optional<std::size_t> current_index;
  transitions_.clear();

  try {
    EnterState(CaptureState::kIdle);
    logger_.Info("starting capture",
                 {{"max_devices", std::to_string(config_.max_devices)},
                  {"read_attempts", std::to_string(config_.read_attempts)},
                  {"output_dir", config_.output_dir.string()}});

    for (const std::size_t index : DeviceProber::CandidateIndices(config_.max_devices)) {
      if (StopRequested()) {
        DeviceLease none;
        (void)Interrupt(none, index, result);
        return result;
      }

      current_index = index;
      ++result.devices_tried;
      CycleOutcome outcome = CycleOutcome::kAdvance;
      try {
        outcome = RunDeviceCycle(index, result);
      } catch (const std::bad_alloc&) {
        throw;
      } catch (const std::exception& ex) {
        logger_.Error("unexpected error on camera", {{"device_index", std::to_string(index)},
                                                     {"error", ex.what()}});
        outcome = CycleOutcome::kAdvance;
      } catch (...) {
        logger_.Error("unexpected error on camera",
                      {{"device_index", std::to_string(index)},
                       {"error", "non-standard exception"}});
        outcome = CycleOutcome::kAdvance;
      }

      if (outcome == CycleOutcome::kSucceeded || outcome == CycleOutcome::kInterrupted) {
        return result;
      }
    }

    EnterState(CaptureState::kExhausted);
    result.success = false;
    result.error_code = CaptureErrorCode::kNoDeviceFound;
    result.error = core::errors::FormatCaptureError(
        CaptureErrorCode::kNoDeviceFound,
        "tried " + std::to_string(result.devices_tried) + " camera indices");
    logger_.Warn("no cameras available",
                 {{"devices_tried", std::to_string(result.devices_tried)},
                  {"error_code", ToStableErrorCode(CaptureErrorCode::kNoDeviceFound)}});
    return result;
  } catch (const std::bad_alloc&) {
    EnterState(CaptureState::kAborted, current_index);
    result.success = false;
    result.fatal = core::errors::IsFatal(CaptureErrorCode::kResourceExhaustion);
    result.device_index.reset();
    result.file_path.reset();
    result.error_code = CaptureErrorCode::kResourceExhaustion;
    result.error = core::errors::FormatCaptureError(CaptureErrorCode::kResourceExhaustion, "");
    logger_.Error("memory exhausted, aborting capture run",
                  {{"device_index", current_index.has_value() ? std::to_string(*current_index)
                                                              : std::string("-")},
                   {"devices_tried", std::to_string(result.devices_tried)},
                   {"error_code", ToStableErrorCode(CaptureErrorCode::kResourceExhaustion)}});
    return result;
  } catch (const std::exception& ex) {
    result.success = false;
    result.device_index.reset();
    result.file_path.reset();
    result.error = std::string("unexpected capture failure: ") + ex.what();
    logger_.Error("unexpected capture failure", {{"error", ex.what()}});
    return result;
  } catch (...) {
    result.success = false;
    result.device_index.reset();
    result.file_path.reset();
    result.error = "unexpected capture failure: non-standard exception";
    logger_.Error("unexpected capture failure", {{"error", "non-standard exception"}});
    return result;
  }
}

CaptureOrchestrator::CycleOutcome CaptureOrchestrator::Interrupt(DeviceLease& lease,
                                                                 const std::size_t index,
                                                                 CaptureResult& result) {
  prober_.Release(lease);
  EnterState(CaptureState::kInterrupted, index);
  result.success = false;
  result.interrupted = true;
  result.error = "capture interrupted by signal";
  logger_.Warn("capture interrupted", {{"device_index", std::to_string(index)}});
  return CycleOutcome::kInterrupted;
}

CaptureOrchestrator::CycleOutcome CaptureOrchestrator::RunDeviceCycle(const std::size_t index,
                                                                      CaptureResult& result) {
  // Declared first so the destructor releases the device on every path out of
  // this cycle, including exceptions.
  DeviceLease lease;
  const std::string index_text = std::to_string(index);

  EnterState(CaptureState::kProbingDevice, index);
  std::string error;
  if (!prober_.OpenDevice(index, lease, error)) {
    return CycleOutcome::kAdvance;
  }

  EnterState(CaptureState::kValidating, index);
  if (!prober_.Validate(lease, config_.read_attempts, config_.validation_retry_delay)) {
    if (StopRequested()) {
      return Interrupt(lease, index, result);
    }
    logger_.Debug("camera validation failed",
                  {{"device_index", index_text},
                   {"error_code", ToStableErrorCode(CaptureErrorCode::kDeviceUnavailable)}});
    prober_.Release(lease);
    return CycleOutcome::kAdvance;
  }
  if (StopRequested()) {
    return Interrupt(lease, index, result);
  }

  Pause(config_.settle_delay);
  EnterState(CaptureState::kCapturingFrame, index);
  backends::FrameSample frame;
  if (!prober_.ReadFrameWithRetry(lease, config_.read_attempts, config_.capture_retry_delay,
                                  "capture", frame, error)) {
    if (StopRequested()) {
      return Interrupt(lease, index, result);
    }
    logger_.Warn("camera capture failed",
                  {{"device_index", index_text},
                   {"error_code", ToStableErrorCode(CaptureErrorCode::kCaptureFailure)},
                   {"error", error}});
    prober_.Release(lease);
    return CycleOutcome::kAdvance;
  }
  if (StopRequested()) {
    return Interrupt(lease, index, result);
  }

  const bool persisted = PersistFrame(index, frame, result);
  prober_.Release(lease);
  if (!persisted) {
    return CycleOutcome::kAdvance;
  }

  EnterState(CaptureState::kSucceeded, index);
  logger_.Success("captured image",
                  {{"device_index", index_text},
                   {"file", result.file_path->string()},
                   {"size_kb", FormatKilobytes(result.file_size_bytes)}});
  return CycleOutcome::kSucceeded;
}

bool CaptureOrchestrator::PersistFrame(const std::size_t index,
                                       const backends::FrameSample& frame,
                                       CaptureResult& result) {
  const std::string index_text = std::to_string(index);
  const fs::path path = config_.output_dir / filename_source_();

  EnterState(CaptureState::kEncoding, index);
  std::string error;
  if (!core::EnsureParentDirectory(path, error)) {
    // The write below reports the actionable failure if the directory is
    // really unusable.
    logger_.Debug("output directory not ready", {{"path", path.string()}, {"error", error}});
  }

  bool written = false;
  try {
    written = writer_.WriteJpeg(frame, path, config_.jpeg_quality, error);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& ex) {
    error = ex.what();
    written = false;
  } catch (...) {
    error = "frame writer raised a non-standard exception";
    written = false;
  }
  if (!written) {
    logger_.Error("image write failed",
                  {{"device_index", index_text},
                   {"path", path.string()},
                   {"error_code", ToStableErrorCode(CaptureErrorCode::kPersistenceFailure)},
                   {"error", error}});
    // A failed encoder may still have left a truncated file behind.
    DiscardRejectedFile(path);
    return false;
  }

  EnterState(CaptureState::kVerifying, index);
  std::uintmax_t size_bytes = 0U;
  if (!VerifyPersistedFile(index, path, size_bytes)) {
    return false;
  }

  result.success = true;
  result.device_index = index;
  result.file_path = AbsoluteOrSelf(path);
  result.file_size_bytes = size_bytes;
  result.error_code.reset();
  result.error.clear();
  return true;
}

bool CaptureOrchestrator::VerifyPersistedFile(const std::size_t index, const fs::path& path,
                                              std::uintmax_t& size_bytes) {
  const std::string index_text = std::to_string(index);
  const std::string_view code = ToStableErrorCode(CaptureErrorCode::kPersistenceFailure);

  std::string error;
  if (!core::ReadRegularFileSize(path, size_bytes, error)) {
    logger_.Warn("image file missing after write",
                 {{"device_index", index_text}, {"error_code", code}, {"error", error}});
    return false;
  }
  if (size_bytes <= config_.min_file_bytes) {
    logger_.Warn("image file too small",
                 {{"device_index", index_text},
                  {"path", path.string()},
                  {"size_bytes", std::to_string(size_bytes)},
                  {"min_bytes", std::to_string(config_.min_file_bytes)},
                  {"error_code", code}});
    DiscardRejectedFile(path);
    return false;
  }

  if (!StopRequested()) {
    Pause(config_.verify_settle_delay);
  }
  std::uintmax_t settled_size = 0U;
  if (!core::ReadRegularFileSize(path, settled_size, error)) {
    logger_.Warn("image file disappeared after save",
                 {{"device_index", index_text},
                  {"path", path.string()},
                  {"error_code", code},
                  {"error", error}});
    return false;
  }
  size_bytes = settled_size;
  return true;
}

void CaptureOrchestrator::DiscardRejectedFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return;
  }
  if (!fs::remove(path, ec) && ec) {
    logger_.Debug("could not remove rejected image file",
                  {{"path", path.string()}, {"error", ec.message()}});
  }
}

} // namespace camshot::capture
