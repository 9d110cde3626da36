#include "capture/device_prober.hpp"

#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"

#include <exception>
#include <new>
#include <string>
#include <thread>
#include <utility>

namespace camshot::capture {

DeviceLease::DeviceLease(std::unique_ptr<backends::ICameraDevice> device)
    : device_(std::move(device)) {}

DeviceLease::~DeviceLease() {
  std::string error;
  (void)Release(error);
}

DeviceLease::DeviceLease(DeviceLease&& other) noexcept : device_(std::move(other.device_)) {}

DeviceLease& DeviceLease::operator=(DeviceLease&& other) noexcept {
  if (this != &other) {
    std::string error;
    (void)Release(error);
    device_ = std::move(other.device_);
  }
  return *this;
}

bool DeviceLease::IsHeld() const {
  return device_ != nullptr;
}

backends::ICameraDevice* DeviceLease::get() const {
  return device_.get();
}

std::optional<std::size_t> DeviceLease::Index() const {
  if (device_ == nullptr) {
    return std::nullopt;
  }
  return device_->Index();
}

bool DeviceLease::Release(std::string& error) {
  error.clear();
  if (device_ == nullptr) {
    return true;
  }

  std::unique_ptr<backends::ICameraDevice> device = std::move(device_);
  bool released = false;
  try {
    released = device->Release(error);
  } catch (const std::exception& ex) {
    error = ex.what();
    released = false;
  } catch (...) {
    error = "camera release raised a non-standard exception";
    released = false;
  }
  return released;
}

DeviceProber::DeviceProber(backends::ICameraDriver& driver, core::logging::Logger& logger)
    : driver_(driver), logger_(logger) {}

std::vector<std::size_t> DeviceProber::CandidateIndices(const std::uint32_t max_devices) {
  std::vector<std::size_t> indices;
  indices.reserve(max_devices);
  for (std::size_t index = 0; index < max_devices; ++index) {
    indices.push_back(index);
  }
  return indices;
}

bool DeviceProber::OpenDevice(const std::size_t index, DeviceLease& lease, std::string& error) {
  error.clear();
  ++open_attempts_;
  logger_.Debug("probing camera", {{"device_index", std::to_string(index)},
                                   {"attempt", std::to_string(open_attempts_)}});

  std::unique_ptr<backends::ICameraDevice> device;
  try {
    device = driver_.Open(index, error);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& ex) {
    error = ex.what();
    device.reset();
  } catch (...) {
    error = "camera driver raised a non-standard exception";
    device.reset();
  }

  if (device == nullptr) {
    if (error.empty()) {
      error = "camera index " + std::to_string(index) + " could not be opened";
    }
    logger_.Debug("camera could not be opened",
                  {{"device_index", std::to_string(index)},
                   {"error_code", core::errors::ToStableErrorCode(
                                      core::errors::CaptureErrorCode::kDeviceUnavailable)},
                   {"error", error}});
    return false;
  }

  lease = DeviceLease(std::move(device));
  return true;
}

bool DeviceProber::Validate(DeviceLease& lease, const std::uint32_t attempts,
                            const std::chrono::milliseconds delay_between) {
  backends::FrameSample frame;
  std::string error;
  return ReadFrameWithRetry(lease, attempts, delay_between, "validation", frame, error);
}

bool DeviceProber::ReadFrameWithRetry(DeviceLease& lease, const std::uint32_t attempts,
                                      const std::chrono::milliseconds delay_between,
                                      std::string_view phase, backends::FrameSample& frame,
                                      std::string& last_error) {
  last_error.clear();
  backends::ICameraDevice* device = lease.get();
  if (device == nullptr) {
    last_error = "no camera is held for " + std::string(phase);
    return false;
  }

  const std::string index_text = std::to_string(device->Index());
  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    if (StopRequested()) {
      last_error = "stop requested during " + std::string(phase);
      logger_.Debug("camera read loop stopped", {{"device_index", index_text},
                                                 {"phase", phase},
                                                 {"attempt", std::to_string(attempt)}});
      return false;
    }
    if (!device->IsOpen()) {
      last_error = "camera index " + index_text + " is no longer open";
      return false;
    }

    bool read_ok = false;
    std::string error;
    try {
      read_ok = device->Read(frame, error);
    } catch (const std::bad_alloc&) {
      throw;
    } catch (const std::exception& ex) {
      // Driver faults carry no frame data; they count as an empty read.
      error = ex.what();
      read_ok = false;
    } catch (...) {
      error = "camera read raised a non-standard exception";
      read_ok = false;
    }

    if (read_ok && frame.IsValid()) {
      logger_.Debug("camera read succeeded", {{"device_index", index_text},
                                              {"phase", phase},
                                              {"attempt", std::to_string(attempt)}});
      return true;
    }

    last_error = error.empty() ? "camera returned an empty frame" : error;
    frame = backends::FrameSample{};
    logger_.Debug("camera read attempt failed", {{"device_index", index_text},
                                                 {"phase", phase},
                                                 {"attempt", std::to_string(attempt)},
                                                 {"max_attempts", std::to_string(attempts)},
                                                 {"error", last_error}});
    if (attempt < attempts && delay_between > std::chrono::milliseconds::zero() &&
        !StopRequested()) {
      std::this_thread::sleep_for(delay_between);
    }
  }
  return false;
}

void DeviceProber::Release(DeviceLease& lease) {
  const std::optional<std::size_t> index = lease.Index();
  if (!index.has_value()) {
    return;
  }

  std::string error;
  if (!lease.Release(error)) {
    logger_.Warn("camera release reported an error",
                 {{"device_index", std::to_string(index.value())}, {"error", error}});
    return;
  }
  logger_.Debug("camera released", {{"device_index", std::to_string(index.value())}});
}

std::uint32_t DeviceProber::open_attempts() const {
  return open_attempts_;
}

void DeviceProber::SetStopFlag(const std::atomic<bool>* stop_requested) {
  stop_requested_ = stop_requested;
}

bool DeviceProber::StopRequested() const {
  return stop_requested_ != nullptr && stop_requested_->load();
}

} // namespace camshot::capture
