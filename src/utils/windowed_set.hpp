#ifndef WINDOWED_SET_HPP
#define WINDOWED_SET_HPP

#include "core/logger.hpp"
#include "utils/time_window.hpp"
#include "utils/value_range.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Windowed {

/**
 * Hash set whose entries expire after a fixed window.
 *
 * Storage is keyed on the (timestamp, value) pair, not on the value alone.
 * Inserting a value that is already present at an earlier instant therefore
 * adds a second entry rather than refreshing the first one. size() and
 * values() report storage entries, duplicates included; drain() collapses
 * them to one occurrence per value.
 *
 * Like WindowedSequence, purging happens on observation only and the class
 * is not thread-safe.
 */
template <typename T, typename Hash = std::hash<T>,
          typename KeyEqual = std::equal_to<T>,
          typename Clock = std::chrono::steady_clock>
class WindowedSet {
public:
  using window_type = TimeWindow<Clock>;
  using clock = typename window_type::clock;
  using time_point = typename window_type::time_point;
  using duration = typename window_type::duration;
  using entry_type = TimedEntry<T, time_point>;
  using value_set = std::unordered_set<T, Hash, KeyEqual>;

private:
  struct EntryHash {
    Hash value_hash;

    size_t operator()(const entry_type &entry) const {
      return Utils::hash_combine(
          std::hash<typename duration::rep>{}(
              entry.timestamp.time_since_epoch().count()),
          value_hash(entry.value));
    }
  };

  struct EntryEqual {
    KeyEqual value_equal;

    bool operator()(const entry_type &a, const entry_type &b) const {
      return a.timestamp == b.timestamp && value_equal(a.value, b.value);
    }
  };

  using storage_type = std::unordered_set<entry_type, EntryHash, EntryEqual>;

public:
  using value_range = ValueRange<T, typename storage_type::const_iterator>;

  template <typename Rep, typename Period>
  explicit WindowedSet(std::chrono::duration<Rep, Period> window,
                       const Hash &hash = Hash(),
                       const KeyEqual &equal = KeyEqual())
      : entries_(0, EntryHash{hash}, EntryEqual{equal}), window_(window) {}

  // All values share a single stamp, so repeated values collapse.
  template <typename InputIt, typename Rep, typename Period>
  static WindowedSet from_collection(InputIt first, InputIt last,
                                     std::chrono::duration<Rep, Period> window,
                                     const Hash &hash = Hash(),
                                     const KeyEqual &equal = KeyEqual()) {
    WindowedSet set(window, hash, equal);
    const time_point stamp = clock::now();
    for (; first != last; ++first)
      set.entries_.emplace(stamp, *first);
    return set;
  }

  template <typename Range, typename Rep, typename Period>
  static WindowedSet from_collection(const Range &initial,
                                     std::chrono::duration<Rep, Period> window,
                                     const Hash &hash = Hash(),
                                     const KeyEqual &equal = KeyEqual()) {
    using std::begin;
    using std::end;
    return from_collection(begin(initial), end(initial), window, hash, equal);
  }

  template <typename Rep, typename Period>
  static WindowedSet from_collection(std::initializer_list<T> initial,
                                     std::chrono::duration<Rep, Period> window,
                                     const Hash &hash = Hash(),
                                     const KeyEqual &equal = KeyEqual()) {
    return from_collection(initial.begin(), initial.end(), window, hash,
                           equal);
  }

  void insert(const T &value) { insert_with_timestamp(value, clock::now()); }
  void insert(T &&value) {
    insert_with_timestamp(std::move(value), clock::now());
  }

  void insert_with_timestamp(const T &value, time_point stamp) {
    entries_.emplace(stamp, value);
  }

  void insert_with_timestamp(T &&value, time_point stamp) {
    entries_.emplace(stamp, std::move(value));
  }

  duration window_duration() const { return window_.length(); }

  // Counts storage entries: a value inserted at two live instants counts
  // twice.
  size_t size() {
    purge();
    return entries_.size();
  }

  bool empty() {
    purge();
    return entries_.empty();
  }

  // One copy per storage entry, in no particular order.
  value_range values() {
    purge();
    return value_range(entries_.cbegin(), entries_.cend(), entries_.size());
  }

  std::vector<T> snapshot() { return values().to_vector(); }

  // Moves the live values out, one occurrence per distinct value, and leaves
  // the set empty.
  value_set drain() && {
    purge();
    value_set drained(entries_.size(), entries_.hash_function().value_hash,
                      entries_.key_eq().value_equal);
    while (!entries_.empty()) {
      auto node = entries_.extract(entries_.begin());
      drained.insert(std::move(node.value().value));
    }
    return drained;
  }

private:
  void purge() {
    if (entries_.empty())
      return;

    const time_point now = clock::now();
    const size_t before = entries_.size();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (window_.contains(it->timestamp, now))
        ++it;
      else
        it = entries_.erase(it);
    }

    const size_t evicted = before - entries_.size();
    if (evicted > 0)
      LOG(LogLevel::TRACE, LogComponent::WINDOW_SET,
          "Evicted " << evicted << " of " << before << " entries");
  }

  storage_type entries_;
  window_type window_;
};

} // namespace Windowed

#endif // WINDOWED_SET_HPP
