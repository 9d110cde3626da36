#include "backends/webcam/opencv_bootstrap.hpp"

#include <string>

#if CAMSHOT_ENABLE_OPENCV
#include <opencv2/core/version.hpp>
#endif

namespace camshot::backends::webcam {

bool IsOpenCvBootstrapEnabled() {
#if CAMSHOT_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

const char* OpenCvBootstrapStatusText() {
#if CAMSHOT_ENABLE_OPENCV
  return "enabled";
#else
  return "disabled";
#endif
}

std::string OpenCvBootstrapDetail() {
#if CAMSHOT_ENABLE_OPENCV
  return std::string("OpenCV capture compiled (OpenCV ") + CV_VERSION + ")";
#else
  return "OpenCV capture not compiled";
#endif
}

std::string OpenCvNotAvailableError() {
  return "BACKEND_NOT_AVAILABLE: OpenCV camera support is not compiled in this build; "
         "rebuild with OpenCV (videoio, imgcodecs) installed";
}

} // namespace camshot::backends::webcam
