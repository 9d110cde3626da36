#pragma once

#include "hostprobe/identity_probe.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace camshot::artifacts {

inline constexpr std::string_view kCaptureExtension = ".jpg";
inline constexpr std::size_t kMaxCaptureFilenameLength = 200U;

// Builds `<host>_<mac>_<user>_<YYYYMMDD_HHMMSS_mmm>.jpg` from local time.
//
// Identity components holding their `unknown` sentinel are omitted rather than
// written out. The result never contains path separators or control
// characters and is at most `kMaxCaptureFilenameLength` characters. When the
// timestamp cannot be formatted the name falls back to
// `capture_<epoch_seconds>.jpg`.
std::string BuildCaptureFilename(const hostprobe::HostIdentity& identity,
                                 std::chrono::system_clock::time_point timestamp);

// Replaces characters that are invalid in Windows or POSIX filenames with `_`.
std::string SanitizeFilename(std::string_view name);

} // namespace camshot::artifacts
