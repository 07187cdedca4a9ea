// === Version Metadata ========================================================
//
// Exposes the simulator's semantic version string used in logs and the HTTP
// user agent.

#pragma once

#include <string_view>

namespace fleet_sim {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace fleet_sim
