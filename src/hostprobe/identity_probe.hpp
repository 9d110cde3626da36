#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camshot::hostprobe {

inline constexpr std::string_view kUnknownHost = "unknown_host";
inline constexpr std::string_view kUnknownMac = "unknown-mac";
inline constexpr std::string_view kUnknownUser = "unknown_user";

// Hostname and username tokens are capped before they reach filenames.
inline constexpr std::size_t kMaxIdentifierLength = 50U;

// Host identity embedded in capture filenames. Fields always hold either a
// normalized value or the matching `kUnknown*` sentinel.
struct HostIdentity {
  std::string hostname = std::string(kUnknownHost);
  std::string mac = std::string(kUnknownMac);
  std::string username = std::string(kUnknownUser);

  // Name of the strategy that produced each field (`fallback` for sentinels).
  std::string hostname_source = "fallback";
  std::string mac_source = "fallback";
  std::string username_source = "fallback";
};

// One lookup step. `lookup` returns a raw value (empty when unavailable) and
// `normalize` turns it into a policy-valid value or nullopt to reject it.
struct LookupStrategy {
  std::string name;
  std::function<std::string()> lookup;
  std::function<std::optional<std::string>(std::string_view)> normalize;
};

struct LookupResult {
  std::string value;
  std::string source;
};

// Runs strategies in order; the first accepted value wins. Strategy failures
// are never fatal; exhausting the list yields `fallback` with source
// `fallback`.
LookupResult ResolveFirstValid(const std::vector<LookupStrategy>& strategies,
                               std::string_view fallback);

// Trims whitespace, maps spaces and path separators to `_`, caps the length.
// Returns nullopt when nothing usable remains.
std::optional<std::string> NormalizeIdentifier(std::string_view raw);

// Accepts `aa:bb:cc:dd:ee:ff`, `aa-bb-...` or 12 bare hex digits and returns
// lowercase `aa-bb-cc-dd-ee-ff`. Rejects malformed, all-zero and
// locally-administered (randomized) addresses.
std::optional<std::string> NormalizeMacAddress(std::string_view raw);

// Default strategy chains used by `ProbeHostIdentity`.
std::vector<LookupStrategy> BuildHostnameStrategies();
std::vector<LookupStrategy> BuildMacStrategies();
std::vector<LookupStrategy> BuildUsernameStrategies();

// Best-effort identity probe. Never throws for lookup failures.
HostIdentity ProbeHostIdentity();

} // namespace camshot::hostprobe
