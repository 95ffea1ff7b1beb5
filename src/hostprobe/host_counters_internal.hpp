#pragma once

#include "hostprobe/host_counters.hpp"

namespace benchtel::hostprobe::internal {

// Platform hook consumed by PlatformCounterSource. Exactly one translation unit
// defines it for the current target.
HostCounterSnapshot ReadHostCountersPlatform();

} // namespace benchtel::hostprobe::internal
