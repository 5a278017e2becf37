#pragma once

namespace pmlink::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace pmlink::core
