#pragma once

namespace flakeid::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "0.3";

}  // namespace flakeid::core
