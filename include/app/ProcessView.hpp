#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "app/Query.hpp"
#include "model/Process.hpp"

namespace vigil::app {

enum class ViewMode { Flat, Grouped, Tree };

// One displayable line of the process list. In grouped mode the numeric
// fields are sums over members and pid is the lowest member pid. In tree
// mode a collapsed node carries its whole subtree's cpu and memory.
struct ProcessRow {
  int32_t pid{};
  std::string name;
  std::string command;
  std::string user;
  vigil::model::ProcState state{vigil::model::ProcState::Unknown};
  double   cpu_percent{};
  double   mem_percent{};
  uint64_t mem_bytes{};
  IoRates  io{};
  uint64_t read_bytes_total{};
  uint64_t write_bytes_total{};
  size_t   count{1};
  std::vector<int32_t> member_pids; // grouped mode, ascending
  int  depth{0};                    // tree mode
  bool matched{true};               // false for context ancestors in a filtered tree
  bool collapsed{false};
  bool has_children{false};
};

struct ProcessListing {
  ViewMode mode{ViewMode::Flat};
  std::vector<ProcessRow> rows;
  std::optional<ParseError> query_error; // filter text that failed to parse
  bool stale{false};
  bool frozen{false};
  size_t total_processes{0};
  uint64_t snapshot_seq{0};
};

} // namespace vigil::app
