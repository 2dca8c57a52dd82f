#include "app/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

namespace vigil::app {

using vigil::util::TomlReader;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name), alt;
  if (n.rfind("VIGIL_", 0) == 0) alt = "vigil_" + n.substr(6);
  else if (n.rfind("vigil_", 0) == 0) alt = "VIGIL_" + n.substr(6);
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vigil/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vigil/config.toml";
  return {};
}

static int resolve_int(const TomlReader& toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml.has(section, key)) {
    auto v = TomlReader::parse_int(toml.get_string(section, key));
    if (v) return *v;
    VIGIL_LOG_WARN("config: %s.%s is not an integer; using %d", section, key, def);
    return def;
  }
  if (env_name) {
    if (const char* e = getenv_compat(env_name)) {
      auto v = TomlReader::parse_int(e);
      if (v) return *v;
      VIGIL_LOG_WARN("config: %s=%s is not an integer; using %d", env_name, e, def);
    }
  }
  return def;
}

static double resolve_double(const TomlReader& toml, const char* section, const char* key,
                             const char* env_name, double def) {
  if (toml.has(section, key)) {
    auto v = TomlReader::parse_double(toml.get_string(section, key));
    if (v) return *v;
    VIGIL_LOG_WARN("config: %s.%s is not a number; using %g", section, key, def);
    return def;
  }
  if (env_name) {
    if (const char* e = getenv_compat(env_name)) {
      auto v = TomlReader::parse_double(e);
      if (v) return *v;
      VIGIL_LOG_WARN("config: %s=%s is not a number; using %g", env_name, e, def);
    }
  }
  return def;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N') return false;
  return true;
}

static bool resolve_bool(const TomlReader& toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml.has(section, key)) return toml.get_bool(section, key, def);
  if (env_name) return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const TomlReader& toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml.has(section, key)) return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return std::string(v);
  }
  return def;
}

EngineConfig load_config(const std::string& path) {
  EngineConfig c{};
  TomlReader toml;
  if (!path.empty() && !toml.load(path)) {
    VIGIL_LOG_DEBUG("config: no file at %s, using environment and defaults", path.c_str());
  }

  // --- [collection] ---
  int rate = resolve_int(toml, "collection", "rate_ms", "VIGIL_RATE_MS", 1000);
  if (rate < kMinRateMs) {
    VIGIL_LOG_WARN("config: collection.rate_ms=%d below minimum, using %d", rate, kMinRateMs);
    rate = kMinRateMs;
  } else if (rate > kMaxRateMs) {
    VIGIL_LOG_WARN("config: collection.rate_ms=%d above maximum, using %d", rate, kMaxRateMs);
    rate = kMaxRateMs;
  }
  c.rate = std::chrono::milliseconds(rate);
  int shutdown = resolve_int(toml, "collection", "shutdown_timeout_ms", "VIGIL_SHUTDOWN_TIMEOUT_MS", 2000);
  c.shutdown_timeout = std::chrono::milliseconds(std::max(0, shutdown));
  int stale = resolve_int(toml, "collection", "stale_after_ms", "VIGIL_STALE_AFTER_MS", 3 * rate);
  if (stale < rate) {
    VIGIL_LOG_WARN("config: collection.stale_after_ms=%d shorter than the rate, using %d", stale, 3 * rate);
    stale = 3 * rate;
  }
  c.stale_after = std::chrono::milliseconds(stale);

  // --- [history] ---
  c.retention_s = resolve_double(toml, "history", "retention_s", "VIGIL_RETENTION_S", 600.0);
  if (!(c.retention_s >= 1.0)) {
    VIGIL_LOG_WARN("config: history.retention_s=%g invalid, using 600", c.retention_s);
    c.retention_s = 600.0;
  }
  c.default_window_s = resolve_double(toml, "history", "default_window_s", "VIGIL_WINDOW_S", 60.0);
  if (!(c.default_window_s > 0.0) || c.default_window_s > c.retention_s) {
    double clamped = std::clamp(c.default_window_s > 0.0 ? c.default_window_s : 60.0, 1.0, c.retention_s);
    VIGIL_LOG_WARN("config: history.default_window_s=%g out of range, using %g", c.default_window_s, clamped);
    c.default_window_s = clamped;
  }

  // --- [graph] ---
  double headroom = resolve_double(toml, "graph", "headroom", "VIGIL_GRAPH_HEADROOM", 1.05);
  c.graph_headroom = std::clamp(headroom, 1.0, 1.1);
  if (c.graph_headroom != headroom)
    VIGIL_LOG_WARN("config: graph.headroom=%g outside [1.0, 1.1], using %g", headroom, c.graph_headroom);
  c.graph_shrink_ticks = std::max(1, resolve_int(toml, "graph", "shrink_ticks", "VIGIL_GRAPH_SHRINK_TICKS", 3));
  c.graph_divisions = std::max(1, resolve_int(toml, "graph", "divisions", "VIGIL_GRAPH_DIVISIONS", 4));

  // --- [process] ---
  c.grouped = resolve_bool(toml, "process", "grouped", "VIGIL_GROUPED", false);
  c.tree = resolve_bool(toml, "process", "tree", "VIGIL_TREE", false);
  c.group_by_command = resolve_bool(toml, "process", "group_by_command", "VIGIL_GROUP_BY_COMMAND", false);
  auto sort_name = resolve_string(toml, "process", "sort", "VIGIL_SORT", "cpu");
  if (auto col = parse_sort_column(sort_name)) c.sort.column = *col;
  else VIGIL_LOG_WARN("config: unknown sort column '%s', using cpu", sort_name.c_str());
  c.sort.direction = resolve_bool(toml, "process", "sort_descending", nullptr, true)
                         ? SortDirection::Descending : SortDirection::Ascending;

  // --- [search] ---
  c.search.ignore_case = resolve_bool(toml, "search", "ignore_case", "VIGIL_IGNORE_CASE", true);
  c.search.whole_word = resolve_bool(toml, "search", "whole_word", nullptr, false);
  c.search.regex = resolve_bool(toml, "search", "regex", nullptr, false);

  // --- [temperature] ---
  auto unit = resolve_string(toml, "temperature", "unit", "VIGIL_TEMP_UNIT", "celsius");
  if (auto u = vigil::util::parse_temp_unit(unit)) c.temp_unit = *u;
  else VIGIL_LOG_WARN("config: unknown temperature unit '%s', using celsius", unit.c_str());

  // --- [log] ---
  c.debug_log = resolve_string(toml, "log", "debug_file", "VIGIL_DEBUG_LOG", "");
  return c;
}

void apply_logging(const EngineConfig& c) {
  if (!c.debug_log.empty()) (void)vigil::util::log_to_file(c.debug_log);
}

} // namespace vigil::app
