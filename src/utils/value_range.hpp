#ifndef VALUE_RANGE_HPP
#define VALUE_RANGE_HPP

#include <cstddef>
#include <iterator>
#include <vector>

namespace Windowed {

/**
 * Lazy view over the values of stored entries.
 *
 * Dereferencing yields a copy of the value, so anything taken out of the
 * range outlives it. The range itself borrows the collection's storage: any
 * mutation or observation of the collection invalidates it.
 */
template <typename T, typename EntryIterator> class ValueRange {
public:
  class const_iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = T;

    const_iterator() = default;
    explicit const_iterator(EntryIterator it) : it_(it) {}

    T operator*() const { return it_->value; }

    const_iterator &operator++() {
      ++it_;
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++it_;
      return tmp;
    }

    bool operator==(const const_iterator &other) const {
      return it_ == other.it_;
    }
    bool operator!=(const const_iterator &other) const {
      return it_ != other.it_;
    }

  private:
    EntryIterator it_{};
  };

  using iterator = const_iterator;

  ValueRange(EntryIterator first, EntryIterator last, size_t count)
      : first_(first), last_(last), count_(count) {}

  const_iterator begin() const { return const_iterator(first_); }
  const_iterator end() const { return const_iterator(last_); }

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }

  std::vector<T> to_vector() const {
    std::vector<T> values;
    values.reserve(count_);
    for (auto it = first_; it != last_; ++it)
      values.push_back(it->value);
    return values;
  }

private:
  EntryIterator first_;
  EntryIterator last_;
  size_t count_;
};

} // namespace Windowed

#endif // VALUE_RANGE_HPP
