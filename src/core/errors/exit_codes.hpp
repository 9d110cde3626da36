#pragma once

namespace camshot::core::errors {

// Stable process-exit contract for unattended/scripted execution.
//
// - 0 image captured and verified on disk
// - 1 no image captured (no usable camera, persistence failures, generic crash)
// - 2 usage/argument failure
//
// The last two follow shell conventions (128 + signal number) so wrappers can
// tell an interrupted run or a memory-starved host apart from "no camera".
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInterrupted = 130,
  kResourceExhausted = 137,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camshot::core::errors
