#include "time.hpp"

namespace srepl::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t MillisBetween(TimePoint earlier, TimePoint later) {
  if (later <= earlier) {
    return 0;
  }
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(later - earlier).count());
}

} // namespace srepl::util
