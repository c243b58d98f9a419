#include "time.hpp"

#include <atomic>

namespace chunkstore::util {

TimePoint Now() {
  return Clock::now();
}

int64_t NowUnixNanos() {
  // strictly increasing within the process
  static std::atomic<int64_t> last{0};

  int64_t now  = ToUnixNanos(Now());
  int64_t prev = last.load();
  while (true) {
    const int64_t next = now > prev ? now : prev + 1;
    if (last.compare_exchange_weak(prev, next)) {
      return next;
    }
  }
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace chunkstore::util
