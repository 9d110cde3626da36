#include "backends/webcam/opencv_frame_writer.hpp"

#include "backends/webcam/opencv_bootstrap.hpp"

#include <cstdint>
#include <new>
#include <string>
#include <vector>

#if CAMSHOT_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#endif

namespace camshot::backends::webcam {

bool OpenCvFrameWriter::WriteJpeg(const FrameSample& frame, const std::filesystem::path& path,
                                  const int quality, std::string& error) {
  error.clear();
  if (!frame.IsValid()) {
    error = "refusing to write an empty frame";
    return false;
  }
  const std::size_t expected_bytes = static_cast<std::size_t>(frame.width) *
                                     static_cast<std::size_t>(frame.height) *
                                     static_cast<std::size_t>(frame.channels);
  if (frame.pixels.size() != expected_bytes) {
    error = "frame buffer size " + std::to_string(frame.pixels.size()) +
            " does not match geometry " + std::to_string(frame.width) + "x" +
            std::to_string(frame.height) + "x" + std::to_string(frame.channels);
    return false;
  }
#if CAMSHOT_ENABLE_OPENCV
  // cv::Mat only wraps mutable buffers, so encode from a private copy.
  std::vector<std::uint8_t> pixels = frame.pixels;
  const cv::Mat view(frame.height, frame.width, CV_8UC(frame.channels), pixels.data());
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
  try {
    if (!cv::imwrite(path.string(), view, params)) {
      error = "cv::imwrite failed for '" + path.string() + "'";
      return false;
    }
  } catch (const cv::Exception& ex) {
    if (ex.code == cv::Error::StsNoMem) {
      throw std::bad_alloc();
    }
    error = std::string("OpenCV write error: ") + ex.what();
    return false;
  }
  return true;
#else
  (void)path;
  (void)quality;
  error = OpenCvNotAvailableError();
  return false;
#endif
}

} // namespace camshot::backends::webcam
