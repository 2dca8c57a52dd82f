#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "app/Query.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

class ProcessRateTracker;

// Same-named (or same-command) processes summed over one tick.
struct GroupedProcess {
  std::string key;
  std::string name;      // name of the first member seen
  double   total_cpu_percent{};
  double   total_mem_percent{};
  uint64_t total_mem_bytes{};
  IoRates  io{};         // valid if any member has a rate
  uint64_t read_bytes_total{};
  uint64_t write_bytes_total{};
  size_t   count{0};
  std::vector<int32_t> member_pids; // ascending
};

// Key a process groups under: its name, or its command line when
// `by_command` (falling back to the name for an empty command line).
const std::string& group_key(const vigil::model::ProcessRecord& r, bool by_command);

// Single pass, rebuilt from scratch each tick. Only processes passing
// `filter` are counted. Groups come out in first-seen order.
std::vector<GroupedProcess> group_processes(const vigil::model::Snapshot& s, bool by_command,
                                            const ProcessRateTracker* rates = nullptr,
                                            const Query* filter = nullptr);

} // namespace vigil::app
