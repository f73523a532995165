#pragma once

namespace mseq::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace mseq::core
