#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "model/Cpu.hpp"
#include "model/Disk.hpp"
#include "model/Net.hpp"
#include "model/Process.hpp"
#include "model/Thermal.hpp"

namespace vigil::model {

using Clock = std::chrono::steady_clock;

struct MemoryReading {
  uint64_t total{};
  uint64_t used{};
  uint64_t swap_total{};
  uint64_t swap_used{};
};

// One complete collection tick. Built entirely by the collection thread, then
// handed to the control thread; neither side touches it concurrently.
struct Snapshot {
  uint64_t seq{};
  Clock::time_point timestamp{};
  std::vector<ProcessRecord> processes;
  CpuReading cpu;
  MemoryReading memory;
  NetworkReading network;
  std::vector<DiskReading> disks;
  std::vector<TemperatureReading> temperatures;
  // Series the collector could not read this tick (e.g. "disk.sdb", "temp").
  // Their readings are absent from this snapshot rather than zero.
  std::vector<std::string> degraded_series;
};

// Programming-error fault (duplicate pid within a snapshot, non-finite
// timestamp). Propagates to the outer supervisor; never caught inside the core.
class InvariantError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Seconds on the monotonic clock, the time axis used by history series.
inline double to_seconds(Clock::time_point tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace vigil::model
