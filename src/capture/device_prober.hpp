#pragma once

#include "backends/camera_device.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camshot::core::logging {
class Logger;
}

namespace camshot::capture {

// Scoped ownership of one open camera device.
//
// The destructor releases the device, so every exit path of a probe cycle
// (early return, exception) gives the handle back to the OS. `Release` may be
// called any number of times; only the first call reaches the device.
class DeviceLease {
public:
  DeviceLease() = default;
  explicit DeviceLease(std::unique_ptr<backends::ICameraDevice> device);
  ~DeviceLease();

  DeviceLease(DeviceLease&& other) noexcept;
  DeviceLease& operator=(DeviceLease&& other) noexcept;

  DeviceLease(const DeviceLease&) = delete;
  DeviceLease& operator=(const DeviceLease&) = delete;

  // True while a device is held and not yet released.
  bool IsHeld() const;
  backends::ICameraDevice* get() const;
  std::optional<std::size_t> Index() const;

  // Returns false with `error` only when the device reported a close failure.
  bool Release(std::string& error);

private:
  std::unique_ptr<backends::ICameraDevice> device_;
};

// Open/validate/release protocol over a bounded, ordered index range.
//
// Failures below this boundary are reported through return values. The one
// exception allowed to escape is `std::bad_alloc`, which the orchestrator
// treats as fatal for the whole run.
class DeviceProber {
public:
  DeviceProber(backends::ICameraDriver& driver, core::logging::Logger& logger);

  // Indices `0 .. max_devices-1` in probe order.
  static std::vector<std::size_t> CandidateIndices(std::uint32_t max_devices);

  bool OpenDevice(std::size_t index, DeviceLease& lease, std::string& error);

  // Up to `attempts` reads; true on the first valid frame. Read errors and
  // thrown driver faults count as failed attempts.
  bool Validate(DeviceLease& lease, std::uint32_t attempts,
                std::chrono::milliseconds delay_between);

  // Retried read shared by validation and the authoritative capture. `phase`
  // labels log lines. On failure `last_error` holds the final attempt's reason.
  // A raised stop flag ends the loop before the next attempt.
  bool ReadFrameWithRetry(DeviceLease& lease, std::uint32_t attempts,
                          std::chrono::milliseconds delay_between, std::string_view phase,
                          backends::FrameSample& frame, std::string& last_error);

  // Never throws; close failures are logged.
  void Release(DeviceLease& lease);

  std::uint32_t open_attempts() const;

  // Optional flag checked before every read attempt.
  void SetStopFlag(const std::atomic<bool>* stop_requested);
  bool StopRequested() const;

private:
  backends::ICameraDriver& driver_;
  core::logging::Logger& logger_;
  std::uint32_t open_attempts_ = 0U;
  const std::atomic<bool>* stop_requested_ = nullptr;
};

} // namespace camshot::capture
