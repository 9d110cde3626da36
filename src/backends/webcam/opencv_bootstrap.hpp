#pragma once

#include <string>

namespace camshot::backends::webcam {

// Reports whether the OpenCV capture path was compiled into the current
// binary.
bool IsOpenCvBootstrapEnabled();

// Short machine-friendly status string: `enabled` or `disabled`.
const char* OpenCvBootstrapStatusText();

// Human-readable status detail for the startup banner and log.
std::string OpenCvBootstrapDetail();

// Error text returned by every device/writer operation in builds without
// OpenCV.
std::string OpenCvNotAvailableError();

} // namespace camshot::backends::webcam
