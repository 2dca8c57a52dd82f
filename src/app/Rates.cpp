#include "app/Rates.hpp"

#include <limits>

namespace vigil::app {

double counter_rate(uint64_t prev_total, uint64_t cur_total, double elapsed_s) {
  if (!(elapsed_s > 0.0)) return std::numeric_limits<double>::quiet_NaN();
  if (cur_total < prev_total) return 0.0;
  return static_cast<double>(cur_total - prev_total) / elapsed_s;
}

void ProcessRateTracker::update(const vigil::model::Snapshot& s) {
  const double t = vigil::model::to_seconds(s.timestamp);
  const double dt = primed_ ? t - prev_t_ : 0.0;
  std::unordered_map<int32_t, Prev> next;
  next.reserve(s.processes.size());
  rates_.clear();
  for (const auto& p : s.processes) {
    next[p.pid] = Prev{p.start_time, p.read_bytes_total, p.write_bytes_total};
    if (!primed_ || dt <= 0.0) continue;
    auto it = prev_.find(p.pid);
    if (it == prev_.end() || it->second.start_time != p.start_time) continue;
    rates_[p.pid] = IoRates{true,
                            counter_rate(it->second.read, p.read_bytes_total, dt),
                            counter_rate(it->second.write, p.write_bytes_total, dt)};
  }
  prev_.swap(next);
  prev_t_ = t;
  primed_ = true;
}

IoRates ProcessRateTracker::rates(int32_t pid) const {
  auto it = rates_.find(pid);
  return it == rates_.end() ? IoRates{} : it->second;
}

void ProcessRateTracker::reset() {
  prev_.clear();
  rates_.clear();
  prev_t_ = 0.0;
  primed_ = false;
}

} // namespace vigil::app
