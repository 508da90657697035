#include "cvec/core/clock.h"

#include <chrono>
#include <ratio>

namespace cvec::core {

std::uint64_t SystemTickClock::now_ticks() {
  using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, kTicksPerSecond>>;
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ticks = std::chrono::duration_cast<Ticks>(now).count();
  // A clock set before 1970 is clamped to the epoch.
  return ticks < 0 ? 0u : static_cast<std::uint64_t>(ticks);
}

std::uint64_t FixedTickClock::now_ticks() {
  return fixed_ticks_;
}

ITickClock& default_tick_clock() {
  static SystemTickClock clock;
  return clock;
}

}  // namespace cvec::core
