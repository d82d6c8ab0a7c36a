#ifndef MONOTONIC_CLOCK_HPP
#define MONOTONIC_CLOCK_HPP

#include <chrono>

namespace Utils {

/**
 * Time source for the windowed collections.
 *
 * Only steady clocks are accepted: a wall clock jump would otherwise evict
 * everything at once or keep entries alive indefinitely.
 */
template <typename Clock = std::chrono::steady_clock> struct MonotonicClock {
  static_assert(Clock::is_steady,
                "MonotonicClock requires a steady (non-decreasing) clock");

  using clock_type = Clock;
  using time_point = typename Clock::time_point;
  using duration = typename Clock::duration;

  static time_point now() { return Clock::now(); }

  // Saturates at zero when `earlier` is after `later`, and at
  // duration::max() when the gap does not fit in a duration.
  static duration elapsed_between(time_point earlier, time_point later) {
    if (later <= earlier)
      return duration::zero();
    const time_point lowest_safe = time_point::min() + duration::max();
    if (later >= lowest_safe && earlier < later - duration::max())
      return duration::max();
    return later - earlier;
  }

  static duration elapsed_since(time_point earlier) {
    return elapsed_between(earlier, now());
  }
};

} // namespace Utils

#endif // MONOTONIC_CLOCK_HPP
