#include "core/errors/capture_error.hpp"

#include <cctype>
#include <string>

namespace camshot::core::errors {

namespace {

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space && !normalized.empty()) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  while (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

} // namespace

std::string_view ToStableErrorCode(const CaptureErrorCode code) {
  switch (code) {
  case CaptureErrorCode::kDeviceUnavailable:
    return "DEVICE_UNAVAILABLE";
  case CaptureErrorCode::kCaptureFailure:
    return "CAPTURE_FAILED";
  case CaptureErrorCode::kPersistenceFailure:
    return "PERSISTENCE_FAILED";
  case CaptureErrorCode::kResourceExhaustion:
    return "RESOURCE_EXHAUSTED";
  case CaptureErrorCode::kNoDeviceFound:
    return "NO_DEVICE_FOUND";
  }
  return "UNKNOWN";
}

bool IsFatal(const CaptureErrorCode code) {
  return code == CaptureErrorCode::kResourceExhaustion;
}

std::string ActionableMessage(const CaptureErrorCode code) {
  switch (code) {
  case CaptureErrorCode::kDeviceUnavailable:
    return "Camera could not be opened or returned no frames; check the connection and close "
           "other applications using it.";
  case CaptureErrorCode::kCaptureFailure:
    return "Camera stopped delivering frames after validation; reconnect the device and retry.";
  case CaptureErrorCode::kPersistenceFailure:
    return "Image could not be written or verified; check free disk space and output directory "
           "permissions.";
  case CaptureErrorCode::kResourceExhaustion:
    return "Host ran out of memory; free resources before retrying.";
  case CaptureErrorCode::kNoDeviceFound:
    return "No working camera found; verify a camera is attached and accessible to this user.";
  }
  return "Unexpected capture failure.";
}

std::string FormatCaptureError(const CaptureErrorCode code, std::string_view detail) {
  std::string formatted = std::string(ToStableErrorCode(code)) + ": " + ActionableMessage(code);
  const std::string normalized_detail = CollapseWhitespace(detail);
  if (!normalized_detail.empty()) {
    formatted += " detail: " + normalized_detail;
  }
  return formatted;
}

} // namespace camshot::core::errors
