#include "hostprobe/identity_probe.hpp"

#include "hostprobe/identity_probe_internal.hpp"

#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <new>
#include <string>
#include <utility>

namespace camshot::hostprobe {

namespace {

std::string Trim(std::string_view value) {
  std::size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }

  std::size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string(value.substr(start, end - start));
}

std::string ReadEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return "";
  }
  return std::string(raw);
}

std::string ReadFirstLine(const char* path) {
  std::ifstream input(path);
  std::string line;
  if (!input || !std::getline(input, line)) {
    return "";
  }
  return line;
}

int HexValue(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (lower >= 'a' && lower <= 'f') {
    return 10 + (lower - 'a');
  }
  return -1;
}

LookupStrategy EnvStrategy(const char* env_name) {
  return {.name = std::string("env:") + env_name,
          .lookup = [env_name]() { return ReadEnv(env_name); },
          .normalize = NormalizeIdentifier};
}

} // namespace

LookupResult ResolveFirstValid(const std::vector<LookupStrategy>& strategies,
                               std::string_view fallback) {
  for (const auto& strategy : strategies) {
    if (!strategy.lookup) {
      continue;
    }

    std::string raw;
    try {
      raw = strategy.lookup();
    } catch (const std::bad_alloc&) {
      throw;
    } catch (const std::exception&) {
      // A broken lookup is just an unavailable one; the next strategy decides.
      continue;
    }
    if (raw.empty()) {
      continue;
    }

    if (!strategy.normalize) {
      return {.value = std::move(raw), .source = strategy.name};
    }
    std::optional<std::string> normalized = strategy.normalize(raw);
    if (normalized.has_value() && !normalized->empty()) {
      return {.value = std::move(normalized.value()), .source = strategy.name};
    }
  }

  return {.value = std::string(fallback), .source = "fallback"};
}

std::optional<std::string> NormalizeIdentifier(std::string_view raw) {
  std::string value = Trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }

  for (char& ch : value) {
    if (ch == ' ' || ch == '/' || ch == '\\') {
      ch = '_';
    }
  }
  if (value.size() > kMaxIdentifierLength) {
    value.resize(kMaxIdentifierLength);
  }
  return value;
}

std::optional<std::string> NormalizeMacAddress(std::string_view raw) {
  const std::string trimmed = Trim(raw);

  std::string digits;
  digits.reserve(12U);
  for (const char ch : trimmed) {
    if (ch == ':' || ch == '-') {
      continue;
    }
    if (HexValue(ch) < 0) {
      return std::nullopt;
    }
    digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if (digits.size() != 12U) {
    return std::nullopt;
  }
  if (digits.find_first_not_of('0') == std::string::npos) {
    return std::nullopt;
  }

  // Bit 0 of the first octet marks multicast, bit 1 a locally administered
  // address. Both show up on hosts with MAC randomization and would leak a
  // per-boot value instead of the hardware identity.
  const int first_octet = HexValue(digits[0]) * 16 + HexValue(digits[1]);
  if ((first_octet & 0x03) != 0) {
    return std::nullopt;
  }

  std::string formatted;
  formatted.reserve(17U);
  for (std::size_t i = 0; i < digits.size(); i += 2U) {
    if (i != 0U) {
      formatted.push_back('-');
    }
    formatted.append(digits, i, 2U);
  }
  return formatted;
}

std::vector<LookupStrategy> BuildHostnameStrategies() {
  std::vector<LookupStrategy> strategies;
  strategies.push_back({.name = "system",
                        .lookup = internal::SystemHostnamePlatform,
                        .normalize = NormalizeIdentifier});
  strategies.push_back(EnvStrategy("COMPUTERNAME"));
  strategies.push_back(EnvStrategy("HOSTNAME"));
  strategies.push_back(EnvStrategy("HOST"));
  strategies.push_back({.name = "file:/etc/hostname",
                        .lookup = []() { return ReadFirstLine("/etc/hostname"); },
                        .normalize = NormalizeIdentifier});
  return strategies;
}

std::vector<LookupStrategy> BuildMacStrategies() {
  std::vector<LookupStrategy> strategies;
  strategies.push_back({.name = "interfaces",
                        .lookup =
                            []() {
                              for (const auto& candidate :
                                   internal::CandidateMacAddressesPlatform()) {
                                if (NormalizeMacAddress(candidate).has_value()) {
                                  return candidate;
                                }
                              }
                              return std::string();
                            },
                        .normalize = NormalizeMacAddress});
  return strategies;
}

std::vector<LookupStrategy> BuildUsernameStrategies() {
  std::vector<LookupStrategy> strategies;
  strategies.push_back({.name = "system",
                        .lookup = internal::EffectiveUsernamePlatform,
                        .normalize = NormalizeIdentifier});
  strategies.push_back(EnvStrategy("USERNAME"));
  strategies.push_back(EnvStrategy("USER"));
  strategies.push_back(EnvStrategy("LOGNAME"));
  return strategies;
}

HostIdentity ProbeHostIdentity() {
  HostIdentity identity;

  LookupResult hostname = ResolveFirstValid(BuildHostnameStrategies(), kUnknownHost);
  identity.hostname = std::move(hostname.value);
  identity.hostname_source = std::move(hostname.source);

  LookupResult mac = ResolveFirstValid(BuildMacStrategies(), kUnknownMac);
  identity.mac = std::move(mac.value);
  identity.mac_source = std::move(mac.source);

  LookupResult username = ResolveFirstValid(BuildUsernameStrategies(), kUnknownUser);
  identity.username = std::move(username.value);
  identity.username_source = std::move(username.source);

  return identity;
}

} // namespace camshot::hostprobe
