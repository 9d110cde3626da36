#include "backends/webcam/opencv_camera_driver.hpp"

#include "backends/webcam/opencv_bootstrap.hpp"

#include <climits>
#include <new>
#include <string>
#include <utility>

#if CAMSHOT_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace camshot::backends::webcam {

namespace {

#if CAMSHOT_ENABLE_OPENCV
// OpenCV reports allocation failures as `cv::Exception`; map them back to the
// standard type so the orchestrator aborts the run instead of trying the next
// camera.
[[noreturn]] void RethrowAsBadAlloc() {
  throw std::bad_alloc();
}

bool CopyToFrameSample(const cv::Mat& source, FrameSample& frame, std::string& error) {
  cv::Mat packed = source;
  if (packed.depth() != CV_8U) {
    cv::Mat converted;
    packed.convertTo(converted, CV_8U);
    packed = converted;
  }
  if (!packed.isContinuous()) {
    packed = packed.clone();
  }

  const std::size_t total_bytes = packed.total() * packed.elemSize();
  if (total_bytes == 0U) {
    error = "camera returned an empty frame";
    return false;
  }

  frame.width = packed.cols;
  frame.height = packed.rows;
  frame.channels = packed.channels();
  frame.pixels.assign(packed.data, packed.data + total_bytes);
  frame.ok = true;
  return true;
}
#endif

} // namespace

struct OpenCvCameraDevice::Impl {
  std::size_t index = 0U;
  bool released = false;
#if CAMSHOT_ENABLE_OPENCV
  cv::VideoCapture capture;
#endif
};

OpenCvCameraDevice::OpenCvCameraDevice(PrivateTag, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

OpenCvCameraDevice::~OpenCvCameraDevice() {
  std::string error;
  (void)Release(error);
}

std::unique_ptr<OpenCvCameraDevice> OpenCvCameraDevice::Open(const std::size_t index,
                                                             std::string& error) {
  error.clear();
#if CAMSHOT_ENABLE_OPENCV
  if (index > static_cast<std::size_t>(INT_MAX)) {
    error = "camera index " + std::to_string(index) + " is out of range for OpenCV";
    return nullptr;
  }

  auto impl = std::make_unique<Impl>();
  impl->index = index;
  try {
    if (!impl->capture.open(static_cast<int>(index), cv::CAP_ANY)) {
      error = "OpenCV could not open camera index " + std::to_string(index);
      return nullptr;
    }
    // Not every backend supports queue sizing; a stale first frame is the
    // only cost of a refusal.
    (void)impl->capture.set(cv::CAP_PROP_BUFFERSIZE, 1.0);
  } catch (const cv::Exception& ex) {
    if (ex.code == cv::Error::StsNoMem) {
      RethrowAsBadAlloc();
    }
    error = "OpenCV error opening camera index " + std::to_string(index) + ": " + ex.what();
    impl->capture.release();
    return nullptr;
  }
  return std::make_unique<OpenCvCameraDevice>(PrivateTag{}, std::move(impl));
#else
  (void)index;
  error = OpenCvNotAvailableError();
  return nullptr;
#endif
}

std::size_t OpenCvCameraDevice::Index() const {
  return impl_->index;
}

bool OpenCvCameraDevice::IsOpen() const {
  if (impl_->released) {
    return false;
  }
#if CAMSHOT_ENABLE_OPENCV
  return impl_->capture.isOpened();
#else
  return false;
#endif
}

bool OpenCvCameraDevice::Read(FrameSample& frame, std::string& error) {
  error.clear();
  frame = FrameSample{};
  if (impl_->released) {
    error = "camera index " + std::to_string(impl_->index) + " was already released";
    return false;
  }
#if CAMSHOT_ENABLE_OPENCV
  if (!impl_->capture.isOpened()) {
    error = "camera index " + std::to_string(impl_->index) + " is not open";
    return false;
  }

  try {
    cv::Mat mat;
    if (!impl_->capture.read(mat)) {
      error = "camera index " + std::to_string(impl_->index) + " returned no frame";
      return false;
    }
    if (mat.empty()) {
      error = "camera index " + std::to_string(impl_->index) + " returned an empty frame";
      return false;
    }
    return CopyToFrameSample(mat, frame, error);
  } catch (const cv::Exception& ex) {
    if (ex.code == cv::Error::StsNoMem) {
      RethrowAsBadAlloc();
    }
    error = std::string("OpenCV read error: ") + ex.what();
    frame = FrameSample{};
    return false;
  }
#else
  error = OpenCvNotAvailableError();
  return false;
#endif
}

bool OpenCvCameraDevice::Release(std::string& error) {
  error.clear();
  if (impl_ == nullptr || impl_->released) {
    return true;
  }
  impl_->released = true;
#if CAMSHOT_ENABLE_OPENCV
  try {
    impl_->capture.release();
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV release error: ") + ex.what();
    return false;
  }
#endif
  return true;
}

std::unique_ptr<ICameraDevice> OpenCvCameraDriver::Open(const std::size_t index,
                                                        std::string& error) {
  return OpenCvCameraDevice::Open(index, error);
}

} // namespace camshot::backends::webcam
