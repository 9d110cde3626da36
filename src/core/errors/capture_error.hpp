#pragma once

#include <string>
#include <string_view>

namespace camshot::core::errors {

// Failure classes for one capture run.
//
// Everything except `kResourceExhaustion` is recovered at the device-cycle
// boundary by moving on to the next camera index. `kNoDeviceFound` is the
// terminal "nothing worked" outcome and is not an error condition.
enum class CaptureErrorCode {
  kDeviceUnavailable,
  kCaptureFailure,
  kPersistenceFailure,
  kResourceExhaustion,
  kNoDeviceFound,
};

std::string_view ToStableErrorCode(CaptureErrorCode code);

// True only for failure classes that must abort the whole run.
bool IsFatal(CaptureErrorCode code);

// Static remediation text for operator-facing output.
std::string ActionableMessage(CaptureErrorCode code);

// Returns single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatCaptureError(CaptureErrorCode code, std::string_view detail);

} // namespace camshot::core::errors
