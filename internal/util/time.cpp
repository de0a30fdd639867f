#include "time.hpp"

namespace research::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

uint64_t MillisAfter(uint64_t base_ms, uint64_t seconds) {
  return base_ms + seconds * 1000;
}

uint64_t SecondsUntil(uint64_t now_ms, uint64_t target_ms) {
  if (target_ms <= now_ms) return 0;
  return (target_ms - now_ms + 999) / 1000;
}

} // namespace research::util
