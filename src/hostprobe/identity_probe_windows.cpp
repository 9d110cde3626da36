#include "hostprobe/identity_probe_internal.hpp"

#if defined(_WIN32)

#define NOMINMAX
#include <windows.h>

namespace camshot::hostprobe::internal {

std::string SystemHostnamePlatform() {
  char name[MAX_COMPUTERNAME_LENGTH + 1] = {};
  DWORD size = static_cast<DWORD>(sizeof(name));
  if (GetComputerNameA(name, &size) != 0 && size > 0U) {
    return std::string(name, size);
  }
  return "";
}

std::string EffectiveUsernamePlatform() {
  char name[257] = {};
  DWORD size = static_cast<DWORD>(sizeof(name));
  if (GetUserNameA(name, &size) != 0 && size > 1U) {
    // `size` includes the terminating null.
    return std::string(name, size - 1U);
  }
  return "";
}

// Adapter enumeration needs iphlpapi; filenames fall back to `unknown-mac`.
std::vector<std::string> CandidateMacAddressesPlatform() {
  return {};
}

} // namespace camshot::hostprobe::internal

#endif
