#pragma once

#include "backends/camera_device.hpp"

#include <filesystem>
#include <string>

namespace camshot::backends::webcam {

// JPEG persistence through `cv::imwrite`.
class OpenCvFrameWriter final : public IFrameWriter {
public:
  bool WriteJpeg(const FrameSample& frame, const std::filesystem::path& path, int quality,
                 std::string& error) override;
};

} // namespace camshot::backends::webcam
