#pragma once
#include <chrono>
#include <string>
#include "app/ProcessSort.hpp"
#include "app/Query.hpp"
#include "util/Units.hpp"

namespace vigil::app {

// Engine tunables. Each key resolves TOML file -> environment -> default.
struct EngineConfig {
  // [collection]
  std::chrono::milliseconds rate{1000};
  std::chrono::milliseconds shutdown_timeout{2000};
  std::chrono::milliseconds stale_after{3000};
  // [history]
  double retention_s{600.0};
  double default_window_s{60.0};
  // [graph]
  double graph_headroom{1.05};
  int graph_shrink_ticks{3};
  int graph_divisions{4};
  // [process]
  bool grouped{false};
  bool tree{false};
  bool group_by_command{false};
  SortState sort{};
  // [search]
  QueryOptions search{};
  // [temperature]
  vigil::util::TempUnit temp_unit{vigil::util::TempUnit::Celsius};
  // [log]
  std::string debug_log;
};

inline constexpr int kMinRateMs = 250;
inline constexpr int kMaxRateMs = 3'600'000;

// $XDG_CONFIG_HOME/vigil/config.toml, else ~/.config/vigil/config.toml
std::string config_file_path();

// A missing file is not an error. Out-of-range values are clamped with a
// warning; unparsable ones fall back to the default.
EngineConfig load_config(const std::string& path = config_file_path());

// Switch logging to the debug file if one is configured.
void apply_logging(const EngineConfig& c);

// Reads NAME, then the lower-case-prefixed alias vigil_NAME
const char* getenv_compat(const char* name);

} // namespace vigil::app
