#include "hostprobe/host_counters_internal.hpp"

#if !defined(__linux__)

namespace benchtel::hostprobe::internal {

// No counter sources outside Linux; every sampled field falls back to zero.
HostCounterSnapshot ReadHostCountersPlatform() {
  return {};
}

} // namespace benchtel::hostprobe::internal

#endif
