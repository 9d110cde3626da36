#include "hostprobe/identity_probe_internal.hpp"

#if defined(__APPLE__)

#include <algorithm>
#include <cstdio>
#include <ifaddrs.h>
#include <net/if_dl.h>
#include <pwd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

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
  struct ifaddrs* interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0 || interfaces == nullptr) {
    return {};
  }

  std::vector<std::pair<std::string, std::string>> named_addresses;
  for (const struct ifaddrs* entry = interfaces; entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_LINK ||
        entry->ifa_name == nullptr) {
      continue;
    }
    const std::string name(entry->ifa_name);
    if (name.rfind("lo", 0) == 0U) {
      continue;
    }
    const auto* link = reinterpret_cast<const struct sockaddr_dl*>(entry->ifa_addr);
    if (link->sdl_alen != 6) {
      continue;
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(LLADDR(link));
    char formatted[18] = {};
    std::snprintf(formatted, sizeof(formatted), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0],
                  bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    named_addresses.emplace_back(name, formatted);
  }
  freeifaddrs(interfaces);

  std::sort(named_addresses.begin(), named_addresses.end());
  std::vector<std::string> addresses;
  addresses.reserve(named_addresses.size());
  for (auto& entry : named_addresses) {
    addresses.push_back(std::move(entry.second));
  }
  return addresses;
}

} // namespace camshot::hostprobe::internal

#endif
