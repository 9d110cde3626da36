#include "hostprobe/identity_probe_internal.hpp"

#if defined(__linux__)

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <pwd.h>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>

namespace camshot::hostprobe::internal {

std::string SystemHostnamePlatform() {
  char name[256] = {};
  if (gethostname(name, sizeof(name)) == 0) {
    name[sizeof(name) - 1U] = '\0';
    return std::string(name);
  }
  return "";
}

std::string EffectiveUsernamePlatform() {
  struct passwd pwd{};
  struct passwd* result = nullptr;
  char buffer[4096] = {};
  if (getpwuid_r(geteuid(), &pwd, buffer, sizeof(buffer), &result) == 0 && result != nullptr &&
      result->pw_name != nullptr) {
    return std::string(result->pw_name);
  }
  return "";
}

std::vector<std::string> CandidateMacAddressesPlatform() {
  namespace fs = std::filesystem;

  std::vector<std::string> interface_names;
  std::error_code ec;
  fs::directory_iterator it("/sys/class/net", ec);
  if (ec) {
    return {};
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    const std::string name = it->path().filename().string();
    if (name.empty() || name == "lo") {
      continue;
    }
    interface_names.push_back(name);
  }

  // Directory order is not stable across boots; sorted order keeps the
  // filename identity stable on multi-NIC hosts.
  std::sort(interface_names.begin(), interface_names.end());

  std::vector<std::string> addresses;
  for (const auto& name : interface_names) {
    std::ifstream input(fs::path("/sys/class/net") / name / "address");
    std::string line;
    if (input && std::getline(input, line) && !line.empty()) {
      addresses.push_back(line);
    }
  }
  return addresses;
}

} // namespace camshot::hostprobe::internal

#endif
