#include "aggregate/metrics_record.hpp"

namespace benchtel::aggregate {

const char* ToString(AveragesSource source) {
  switch (source) {
  case AveragesSource::kNone:
    return "none";
  case AveragesSource::kDstat:
    return "dstat";
  case AveragesSource::kSar:
    return "sar";
  case AveragesSource::kTimeseries:
    return "timeseries";
  }
  return "none";
}

} // namespace benchtel::aggregate
