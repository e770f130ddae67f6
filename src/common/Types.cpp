#include "common/Types.hpp"

namespace dnscache::common {

ClockFn systemClock() {
  return [] { return Clock::now(); };
}

}  // namespace dnscache::common
