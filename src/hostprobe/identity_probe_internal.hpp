#pragma once

#include "hostprobe/identity_probe.hpp"

#include <string>
#include <vector>

namespace camshot::hostprobe::internal {

// Platform hook points consumed by the shared identity strategies. Each hook
// returns an empty value when the platform cannot answer.
std::string SystemHostnamePlatform();
std::string EffectiveUsernamePlatform();
// Raw hardware addresses of non-loopback interfaces, in stable order.
std::vector<std::string> CandidateMacAddressesPlatform();

} // namespace camshot::hostprobe::internal
