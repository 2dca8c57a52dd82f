#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::model {

enum class ProcState { Running, Sleeping, DiskSleep, Stopped, Zombie, Idle, Unknown };

// Kernel single-letter state ('R', 'S', 'D', 'T', 't', 'Z', 'I', 'X') to enum.
ProcState state_from_char(char c);
const char* state_name(ProcState s);

// One process as seen in one collection tick. Counters are cumulative totals;
// rates are derived by the consumer. Never mutated after the tick is published.
struct ProcessRecord {
  int32_t pid{};
  std::optional<int32_t> parent_pid; // nullopt for roots (pid 1, kthreadd)
  std::string name;
  std::string command_line;
  std::string user;
  ProcState state{ProcState::Unknown};
  double   cpu_percent{};  // 0..100 per core, may exceed 100 for multithreaded
  double   mem_percent{};  // share of total memory, 0..100
  uint64_t mem_bytes{};    // resident set
  uint64_t read_bytes_total{};
  uint64_t write_bytes_total{};
  uint64_t start_time{};   // clock ticks since boot; disambiguates pid reuse
};

} // namespace vigil::model
