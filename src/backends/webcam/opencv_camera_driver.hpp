#pragma once

#include "backends/camera_device.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace camshot::backends::webcam {

// OpenCV `VideoCapture` handle for one device index.
//
// Responsibilities:
// - own the capture handle and release it exactly once
// - shrink the driver-side frame queue so reads return fresh images
// - copy decoded frames into `FrameSample` so OpenCV types stay out of the
//   rest of the program
class OpenCvCameraDevice final : public ICameraDevice {
  struct Impl;
  // Restricts construction to `Open`.
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  OpenCvCameraDevice(PrivateTag, std::unique_ptr<Impl> impl);
  OpenCvCameraDevice(const OpenCvCameraDevice&) = delete;
  OpenCvCameraDevice& operator=(const OpenCvCameraDevice&) = delete;

  ~OpenCvCameraDevice() override;

  // Opens `index` with the default OpenCV capture API. Returns nullptr and
  // sets `error` when the device cannot be acquired.
  static std::unique_ptr<OpenCvCameraDevice> Open(std::size_t index, std::string& error);

  std::size_t Index() const override;
  bool IsOpen() const override;
  bool Read(FrameSample& frame, std::string& error) override;
  bool Release(std::string& error) override;

private:
  std::unique_ptr<Impl> impl_;
};

class OpenCvCameraDriver final : public ICameraDriver {
public:
  std::unique_ptr<ICameraDevice> Open(std::size_t index, std::string& error) override;
};

} // namespace camshot::backends::webcam
