#ifndef WINDOWED_SEQUENCE_HPP
#define WINDOWED_SEQUENCE_HPP

#include "core/logger.hpp"
#include "utils/time_window.hpp"
#include "utils/value_range.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace Windowed {

/**
 * Append-only sequence whose entries expire after a fixed window.
 *
 * Entries are stamped on push and purged lazily: every observation (size,
 * values, drain, ...) first drops entries whose age reached the window.
 * Pushing never purges. Survivors keep their insertion order and duplicates
 * are allowed.
 *
 * Not thread-safe. Observations mutate the storage, so they need the same
 * exclusive access as pushes.
 */
template <typename T, typename Clock = std::chrono::steady_clock>
class WindowedSequence {
public:
  using window_type = TimeWindow<Clock>;
  using clock = typename window_type::clock;
  using time_point = typename window_type::time_point;
  using duration = typename window_type::duration;
  using entry_type = TimedEntry<T, time_point>;
  using storage_type = std::deque<entry_type>;
  using value_range = ValueRange<T, typename storage_type::const_iterator>;

  template <typename Rep, typename Period>
  explicit WindowedSequence(std::chrono::duration<Rep, Period> window)
      : window_(window) {}

  void push(const T &value) { push_with_timestamp(value, clock::now()); }
  void push(T &&value) { push_with_timestamp(std::move(value), clock::now()); }

  // The stamp is taken as is; one already outside the window is dropped by
  // the next observation.
  void push_with_timestamp(const T &value, time_point stamp) {
    track_order(stamp);
    entries_.emplace_back(stamp, value);
  }

  void push_with_timestamp(T &&value, time_point stamp) {
    track_order(stamp);
    entries_.emplace_back(stamp, std::move(value));
  }

  size_t size() {
    purge();
    return entries_.size();
  }

  bool empty() {
    purge();
    return entries_.empty();
  }

  // Survivors in insertion order. Invalidated by any later call on this
  // sequence.
  value_range values() {
    purge();
    return value_range(entries_.cbegin(), entries_.cend(), entries_.size());
  }

  std::vector<T> snapshot() { return values().to_vector(); }

  // Moves the survivors out in insertion order and leaves the sequence empty.
  std::vector<T> drain() && {
    purge();
    std::vector<T> drained;
    drained.reserve(entries_.size());
    for (auto &entry : entries_)
      drained.push_back(std::move(entry.value));
    entries_.clear();
    in_order_ = true;
    return drained;
  }

  duration window_duration() const { return window_.length(); }

private:
  void track_order(time_point stamp) {
    if (in_order_ && !entries_.empty() && stamp < entries_.back().timestamp)
      in_order_ = false;
  }

  void purge() {
    if (entries_.empty())
      return;

    const time_point now = clock::now();
    const size_t before = entries_.size();
    auto expired = [this, now](const entry_type &entry) {
      return !window_.contains(entry.timestamp, now);
    };

    if (in_order_) {
      // Stamps never decrease, so the expired entries form a prefix.
      auto first_to_keep =
          std::partition_point(entries_.begin(), entries_.end(), expired);
      entries_.erase(entries_.begin(), first_to_keep);
    } else {
      entries_.erase(std::remove_if(entries_.begin(), entries_.end(), expired),
                     entries_.end());
      in_order_ = std::is_sorted(
          entries_.begin(), entries_.end(),
          [](const entry_type &a, const entry_type &b) {
            return a.timestamp < b.timestamp;
          });
    }

    const size_t evicted = before - entries_.size();
    if (evicted > 0)
      LOG(LogLevel::TRACE, LogComponent::WINDOW_SEQUENCE,
          "Evicted " << evicted << " of " << before << " entries");
  }

  storage_type entries_;
  window_type window_;

  // True while stamps were appended in non-decreasing order.
  bool in_order_ = true;
};

} // namespace Windowed

#endif // WINDOWED_SEQUENCE_HPP
