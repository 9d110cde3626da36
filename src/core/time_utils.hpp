#ifndef CAMSHOT_CORE_TIME_UTILS_HPP_
#define CAMSHOT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camshot::core {

// Local wall-clock stamp used in capture filenames: `YYYYMMDD_HHMMSS_mmm`.
// Returns an empty string when the platform cannot convert the time point.
inline std::string FormatLocalFilenameTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
#if defined(_WIN32)
  const errno_t result = localtime_s(&local_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = localtime_r(&epoch_seconds, &local_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&local_time, "%Y%m%d_%H%M%S") << '_' << std::setw(3) << std::setfill('0')
      << millis_component;
  return out.str();
}

inline std::int64_t ToEpochSeconds(std::chrono::system_clock::time_point timestamp) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count());
}

inline std::int64_t ToEpochMillis(std::chrono::system_clock::time_point timestamp) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count());
}

} // namespace camshot::core

#endif // CAMSHOT_CORE_TIME_UTILS_HPP_
