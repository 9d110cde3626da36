#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace camshot::backends {

// One decoded image returned by a device read.
//
// Pixels are tightly packed 8-bit rows (`width * channels` bytes per row) in
// the channel order the driver delivers (BGR for OpenCV). A sample is usable
// only when `ok` is set and the buffer is non-empty.
struct FrameSample {
  bool ok = false;
  int width = 0;
  int height = 0;
  int channels = 0;
  std::vector<std::uint8_t> pixels;

  bool IsValid() const {
    return ok && !pixels.empty() && width > 0 && height > 0 && channels > 0;
  }

  std::size_t SizeBytes() const {
    return pixels.size();
  }
};

// Open camera handle for one device index.
//
// Contract:
// - `Read` returns false (with `error`) for "no frame"; it may also throw,
//   callers treat a throw like a failed read except for `std::bad_alloc`
// - `Release` is idempotent and reports problems through `error` only
class ICameraDevice {
public:
  virtual ~ICameraDevice() = default;

  virtual std::size_t Index() const = 0;
  virtual bool IsOpen() const = 0;
  virtual bool Read(FrameSample& frame, std::string& error) = 0;
  virtual bool Release(std::string& error) = 0;
};

// Opens devices by index. Returns nullptr with `error` set when the index
// cannot be acquired (missing, busy, driver failure, no camera library).
class ICameraDriver {
public:
  virtual ~ICameraDriver() = default;

  virtual std::unique_ptr<ICameraDevice> Open(std::size_t index, std::string& error) = 0;
};

// Encodes a frame as JPEG and writes it to `path`. Returns false with `error`
// when encoding or writing fails; implementations may also throw.
class IFrameWriter {
public:
  virtual ~IFrameWriter() = default;

  virtual bool WriteJpeg(const FrameSample& frame, const std::filesystem::path& path,
                         int quality, std::string& error) = 0;
};

} // namespace camshot::backends
