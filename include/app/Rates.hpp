#pragma once
#include <cstdint>
#include <unordered_map>
#include "app/Query.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

// Per-second rate between two cumulative counter readings. A counter that
// went backwards (reset, wrap) yields 0; a non-positive interval yields NaN.
double counter_rate(uint64_t prev_total, uint64_t cur_total, double elapsed_s);

// Derives per-process I/O rates from consecutive snapshots. A pid counts as
// the same process only while its start_time is unchanged.
class ProcessRateTracker {
public:
  void update(const vigil::model::Snapshot& s);
  [[nodiscard]] IoRates rates(int32_t pid) const;
  void reset();

private:
  struct Prev {
    uint64_t start_time;
    uint64_t read;
    uint64_t write;
  };
  std::unordered_map<int32_t, Prev> prev_;
  std::unordered_map<int32_t, IoRates> rates_;
  double prev_t_{0.0};
  bool primed_{false};
};

} // namespace vigil::app
