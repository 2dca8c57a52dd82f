#include "app/HistoryStore.hpp"

#include <algorithm>
#include <cmath>
#include "model/Snapshot.hpp"
#include "util/Log.hpp"

namespace vigil::app {

size_t SeriesRing::lower_bound(double x) const {
  size_t lo = 0, hi = size_;
  while (lo < hi) {
    size_t mid = lo + (hi - lo) / 2;
    if (at(mid).t < x) lo = mid + 1; else hi = mid;
  }
  return lo;
}

size_t SeriesRing::upper_bound(double x) const {
  size_t lo = 0, hi = size_;
  while (lo < hi) {
    size_t mid = lo + (hi - lo) / 2;
    if (at(mid).t <= x) lo = mid + 1; else hi = mid;
  }
  return lo;
}

HistoryStore::HistoryStore(double retention_s, double interval_s)
    : retention_s_(retention_s > 0 ? retention_s : 600.0) {
  double iv = interval_s > 0 ? interval_s : 1.0;
  capacity_ = static_cast<size_t>(std::ceil(retention_s_ / iv));
  if (capacity_ == 0) capacity_ = 1;
}

bool HistoryStore::append(std::string_view metric, double t, double value) {
  if (!std::isfinite(t))
    throw vigil::model::InvariantError("history: non-finite timestamp for " + std::string(metric));
  auto it = series_.find(metric);
  if (it == series_.end()) it = series_.emplace(std::string(metric), SeriesRing(capacity_)).first;
  auto& ring = it->second;
  if (!ring.empty() && t <= ring.back().t) {
    ++rejected_;
    VIGIL_LOG_DEBUG("history: dropped out-of-order sample for %.*s (t=%.3f, last=%.3f)",
                    static_cast<int>(metric.size()), metric.data(), t, ring.back().t);
    return false;
  }
  // Only the front can be older than the window since samples are ordered
  const double cutoff = t - retention_s_;
  while (!ring.empty() && ring.front().t < cutoff) ring.pop_front();
  ring.push_back(Sample{t, value});
  return true;
}

const SeriesRing* HistoryStore::find(std::string_view metric) const {
  auto it = series_.find(metric);
  return it == series_.end() ? nullptr : &it->second;
}

SeriesView HistoryStore::range(std::string_view metric, double from, double to) const {
  const auto* ring = find(metric);
  if (!ring || ring->empty() || from > to) return {};
  size_t first = ring->lower_bound(from);
  size_t last = ring->upper_bound(to);
  if (first >= last) return {};
  return SeriesView(ring, first, last);
}

std::optional<Sample> HistoryStore::latest(std::string_view metric) const {
  const auto* ring = find(metric);
  if (!ring || ring->empty()) return std::nullopt;
  return ring->back();
}

std::vector<std::string> HistoryStore::metrics() const {
  std::vector<std::string> out;
  out.reserve(series_.size());
  for (const auto& [k, v] : series_) out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}

size_t HistoryStore::size(std::string_view metric) const {
  const auto* ring = find(metric);
  return ring ? ring->size() : 0;
}

void HistoryStore::reset() {
  series_.clear();
  rejected_ = 0;
}

} // namespace vigil::app
