#include "artifacts/capture_filename.hpp"

#include "core/time_utils.hpp"

#include <string>
#include <vector>

namespace camshot::artifacts {

namespace {

constexpr std::size_t kHostnameComponentLimit = 30U;
constexpr std::size_t kMacComponentLimit = 20U;
constexpr std::size_t kUsernameComponentLimit = 20U;

void AddComponent(std::vector<std::string>& components, const std::string& value,
                  std::string_view sentinel, const std::size_t limit) {
  if (value.empty() || value == sentinel) {
    return;
  }
  components.push_back(value.substr(0, limit));
}

bool IsInvalidFilenameChar(const char ch) {
  const auto as_unsigned = static_cast<unsigned char>(ch);
  if (as_unsigned < 0x20U || as_unsigned == 0x7FU) {
    return true;
  }
  switch (ch) {
  case '<':
  case '>':
  case ':':
  case '"':
  case '/':
  case '\\':
  case '|':
  case '?':
  case '*':
    return true;
  default:
    return false;
  }
}

} // namespace

std::string SanitizeFilename(std::string_view name) {
  std::string sanitized(name);
  for (char& ch : sanitized) {
    if (IsInvalidFilenameChar(ch)) {
      ch = '_';
    }
  }
  return sanitized;
}

std::string BuildCaptureFilename(const hostprobe::HostIdentity& identity,
                                 const std::chrono::system_clock::time_point timestamp) {
  const std::string stamp = core::FormatLocalFilenameTimestamp(timestamp);
  if (stamp.empty()) {
    return "capture_" + std::to_string(core::ToEpochSeconds(timestamp)) +
           std::string(kCaptureExtension);
  }

  std::vector<std::string> components;
  AddComponent(components, identity.hostname, hostprobe::kUnknownHost, kHostnameComponentLimit);
  AddComponent(components, identity.mac, hostprobe::kUnknownMac, kMacComponentLimit);
  AddComponent(components, identity.username, hostprobe::kUnknownUser, kUsernameComponentLimit);
  components.push_back(stamp);

  std::string stem;
  for (const auto& component : components) {
    if (!stem.empty()) {
      stem.push_back('_');
    }
    stem += component;
  }
  stem = SanitizeFilename(stem);

  const std::size_t max_stem = kMaxCaptureFilenameLength - kCaptureExtension.size();
  if (stem.size() > max_stem) {
    stem.resize(max_stem);
  }
  return stem + std::string(kCaptureExtension);
}

} // namespace camshot::artifacts
