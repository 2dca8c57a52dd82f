#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vigil::app {

struct Sample {
  double t{};     // seconds, monotonic clock
  double value{};
};

// Fixed-capacity circular buffer of samples, oldest first.
class SeriesRing {
public:
  explicit SeriesRing(size_t capacity) : buf_(capacity ? capacity : 1) {}

  [[nodiscard]] size_t size() const { return size_; }
  [[nodiscard]] size_t capacity() const { return buf_.size(); }
  [[nodiscard]] bool empty() const { return size_ == 0; }
  [[nodiscard]] const Sample& at(size_t i) const { return buf_[(head_ + i) % buf_.size()]; }
  [[nodiscard]] const Sample& front() const { return at(0); }
  [[nodiscard]] const Sample& back() const { return at(size_ - 1); }

  // Overwrites the oldest sample when full.
  void push_back(const Sample& s) {
    if (size_ == buf_.size()) {
      buf_[head_] = s;
      head_ = (head_ + 1) % buf_.size();
      return;
    }
    buf_[(head_ + size_) % buf_.size()] = s;
    ++size_;
  }
  void pop_front() {
    if (size_ == 0) return;
    head_ = (head_ + 1) % buf_.size();
    --size_;
  }
  void clear() { head_ = 0; size_ = 0; }

  // First index whose t >= x (binary search; samples are time-ordered)
  [[nodiscard]] size_t lower_bound(double x) const;
  // First index whose t > x
  [[nodiscard]] size_t upper_bound(double x) const;

private:
  std::vector<Sample> buf_;
  size_t head_{0};
  size_t size_{0};
};

// Lazy window over one series. Iterating it twice yields the same samples.
// Valid until the next append or reset on the owning store.
class SeriesView {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Sample;
    using difference_type = std::ptrdiff_t;
    using pointer = const Sample*;
    using reference = const Sample&;

    iterator() = default;
    iterator(const SeriesRing* r, size_t i) : ring_(r), idx_(i) {}
    reference operator*() const { return ring_->at(idx_); }
    pointer operator->() const { return &ring_->at(idx_); }
    iterator& operator++() { ++idx_; return *this; }
    iterator operator++(int) { auto tmp = *this; ++idx_; return tmp; }
    bool operator==(const iterator& o) const { return idx_ == o.idx_ && ring_ == o.ring_; }
    bool operator!=(const iterator& o) const { return !(*this == o); }

  private:
    const SeriesRing* ring_{nullptr};
    size_t idx_{0};
  };

  SeriesView() = default;
  SeriesView(const SeriesRing* r, size_t first, size_t last) : ring_(r), first_(first), last_(last) {}

  [[nodiscard]] iterator begin() const { return iterator(ring_, first_); }
  [[nodiscard]] iterator end() const { return iterator(ring_, last_); }
  [[nodiscard]] size_t size() const { return last_ - first_; }
  [[nodiscard]] bool empty() const { return first_ == last_; }
  [[nodiscard]] const Sample& operator[](size_t i) const { return ring_->at(first_ + i); }

  [[nodiscard]] std::vector<Sample> to_vector() const { return std::vector<Sample>(begin(), end()); }

private:
  const SeriesRing* ring_{nullptr};
  size_t first_{0};
  size_t last_{0};
};

// Per-metric bounded time series. Every series holds at most
// ceil(retention / interval) samples, and samples older than the retention
// window are evicted from the front on each append.
class HistoryStore {
public:
  HistoryStore(double retention_s, double interval_s);

  // Rejects (returns false, logs at debug) a timestamp that is not strictly
  // after the series' last one. Throws InvariantError on a non-finite time.
  bool append(std::string_view metric, double t, double value);

  // Samples with from <= t <= to. Empty for unknown metrics and for windows
  // entirely outside the retained data.
  [[nodiscard]] SeriesView range(std::string_view metric, double from, double to) const;

  [[nodiscard]] std::optional<Sample> latest(std::string_view metric) const;
  [[nodiscard]] std::vector<std::string> metrics() const; // sorted
  [[nodiscard]] size_t size(std::string_view metric) const;

  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] double retention() const { return retention_s_; }
  [[nodiscard]] uint64_t rejected() const { return rejected_; }

  void reset();

private:
  struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view s) const { return std::hash<std::string_view>{}(s); }
  };

  const SeriesRing* find(std::string_view metric) const;

  double retention_s_;
  size_t capacity_;
  uint64_t rejected_{0};
  std::unordered_map<std::string, SeriesRing, StringHash, std::equal_to<>> series_;
};

} // namespace vigil::app
