#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "model/Snapshot.hpp"

// Synthetic records and snapshots for tests and the frame benchmark.
namespace fixtures {

inline vigil::model::ProcessRecord proc(int32_t pid, std::optional<int32_t> ppid, std::string name,
                                        double cpu = 0.0, double mem_pct = 0.0, uint64_t mem_bytes = 0) {
  vigil::model::ProcessRecord r;
  r.pid = pid;
  r.parent_pid = ppid;
  r.command_line = "/usr/bin/" + name;
  r.name = std::move(name);
  r.user = "root";
  r.state = vigil::model::ProcState::Sleeping;
  r.cpu_percent = cpu;
  r.mem_percent = mem_pct;
  r.mem_bytes = mem_bytes;
  r.start_time = 1000 + static_cast<uint64_t>(pid);
  return r;
}

// Timestamp `secs` after an arbitrary fixed origin on the monotonic clock
inline vigil::model::Clock::time_point at(double secs) {
  return vigil::model::Clock::time_point(std::chrono::hours(1)) +
         std::chrono::duration_cast<vigil::model::Clock::duration>(std::chrono::duration<double>(secs));
}

inline vigil::model::Snapshot snapshot(double secs, std::vector<vigil::model::ProcessRecord> procs = {}) {
  vigil::model::Snapshot s;
  s.timestamp = at(secs);
  s.processes = std::move(procs);
  s.memory.total = 8ull << 30;
  s.memory.used = 2ull << 30;
  s.cpu.per_core_pct = {10.0, 20.0};
  s.cpu.average_pct = 15.0;
  return s;
}

} // namespace fixtures
