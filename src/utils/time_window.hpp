#ifndef TIME_WINDOW_HPP
#define TIME_WINDOW_HPP

#include "core/logger.hpp"
#include "utils/monotonic_clock.hpp"

#include <chrono>
#include <ratio>
#include <utility>

namespace Windowed {

// One stored element and the instant it was recorded at.
template <typename T, typename TimePoint> struct TimedEntry {
  TimePoint timestamp;
  T value;

  TimedEntry(TimePoint stamp, const T &v) : timestamp(stamp), value(v) {}
  TimedEntry(TimePoint stamp, T &&v) : timestamp(stamp), value(std::move(v)) {}
};

/**
 * Fixed-length window shared by the collections.
 *
 * An entry stamped at `t` is inside the window at `now` while
 * `now - t < length()`. The length is set once and never changes; a negative
 * length is clamped to zero, which makes every entry expire immediately.
 * A length too large for the clock's duration (or a NaN/infinite one)
 * saturates at duration::max().
 */
template <typename Clock = std::chrono::steady_clock> class TimeWindow {
public:
  using clock = Utils::MonotonicClock<Clock>;
  using time_point = typename clock::time_point;
  using duration = typename clock::duration;

  template <typename Rep, typename Period>
  explicit TimeWindow(std::chrono::duration<Rep, Period> length)
      : length_(clamp_length(length)) {}

  duration length() const { return length_; }

  bool contains(time_point stamp, time_point now) const {
    return clock::elapsed_between(stamp, now) < length_;
  }

private:
  template <typename Rep, typename Period>
  static duration clamp_length(std::chrono::duration<Rep, Period> length) {
    if (length < std::chrono::duration<Rep, Period>::zero()) {
      LOG(LogLevel::WARN, LogComponent::WINDOW,
          "Negative window length ("
              << (std::chrono::duration<double, std::milli>(length).count())
              << " ms) clamped to zero");
      return duration::zero();
    }
    // Compared in floating point so the check itself cannot overflow; NaN
    // fails the comparison and saturates too.
    using wide = std::chrono::duration<double, typename duration::period>;
    if (!(wide(length) < wide(duration::max()))) {
      LOG(LogLevel::DEBUG, LogComponent::WINDOW,
          "Window length exceeds the clock range, saturated");
      return duration::max();
    }
    return std::chrono::duration_cast<duration>(length);
  }

  duration length_;
};

} // namespace Windowed

#endif // TIME_WINDOW_HPP
