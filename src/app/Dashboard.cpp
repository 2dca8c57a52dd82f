#include "app/Dashboard.hpp"

#include <algorithm>
#include <cmath>
#include "app/ProcessGroups.hpp"
#include "app/ProcessTree.hpp"
#include "util/Log.hpp"

namespace vigil::app {

using vigil::model::Snapshot;

static bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

static bool degraded(const Snapshot& s, std::string_view series) {
  return std::find(s.degraded_series.begin(), s.degraded_series.end(), series) != s.degraded_series.end();
}

static ProcessRow row_from(const vigil::model::ProcessRecord& r, const IoRates& io) {
  ProcessRow row;
  row.pid = r.pid;
  row.name = r.name;
  row.command = r.command_line;
  row.user = r.user;
  row.state = r.state;
  row.cpu_percent = r.cpu_percent;
  row.mem_percent = r.mem_percent;
  row.mem_bytes = r.mem_bytes;
  row.io = io;
  row.read_bytes_total = r.read_bytes_total;
  row.write_bytes_total = r.write_bytes_total;
  return row;
}

Dashboard::Dashboard(const EngineConfig& cfg, std::shared_ptr<SnapshotChannel> channel, IProcessKiller& killer)
    : cfg_(cfg),
      channel_(std::move(channel)),
      terminator_(killer),
      history_(cfg.retention_s, std::chrono::duration<double>(cfg.rate).count()),
      search_(cfg.search),
      sort_(cfg.sort),
      window_s_(std::min(cfg.default_window_s > 0.0 ? cfg.default_window_s : 60.0, history_.retention())),
      grouped_(cfg.grouped),
      group_by_command_(cfg.group_by_command),
      tree_(cfg.tree) {}

bool Dashboard::refresh() {
  if (!channel_) return false;
  auto s = channel_->try_take();
  if (!s) return false;
  ingest(std::move(*s));
  return true;
}

void Dashboard::ingest(Snapshot s) {
  check_unique_pids(s);
  if (latest_ && s.timestamp <= latest_->timestamp) {
    VIGIL_LOG_DEBUG("dropping snapshot %llu: timestamp not after the current one",
                    static_cast<unsigned long long>(s.seq));
    return;
  }
  last_arrival_ = vigil::model::Clock::now();
  record_metrics(s);
  rates_.update(s);
  latest_ = std::make_shared<const Snapshot>(std::move(s));
}

LadderKind Dashboard::ladder_for(std::string_view metric) {
  if (ends_with(metric, "_pct") || metric.starts_with("cpu.")) return LadderKind::Percent;
  if (ends_with(metric, "_bps") || ends_with(metric, "_bytes")) return LadderKind::BinaryBytes;
  return LadderKind::Decimal125;
}

AdaptiveScaler& Dashboard::scaler_for(const std::string& metric) {
  auto it = scalers_.find(metric);
  if (it == scalers_.end()) {
    it = scalers_.emplace(metric, AdaptiveScaler(ladder_for(metric), cfg_.graph_headroom,
                                                 cfg_.graph_shrink_ticks, cfg_.graph_divisions)).first;
  }
  return it->second;
}

void Dashboard::append(const std::string& metric, double t, double value) {
  if (!std::isfinite(value)) return;
  if (history_.append(metric, t, value)) touched_.insert(metric);
}

void Dashboard::record_metrics(const Snapshot& s) {
  const double t = vigil::model::to_seconds(s.timestamp);
  const Snapshot* prev = latest_.get();
  const double dt = prev ? t - vigil::model::to_seconds(prev->timestamp) : 0.0;
  touched_.clear();

  if (!degraded(s, "cpu")) {
    append("cpu.avg", t, s.cpu.average_pct);
    for (size_t i = 0; i < s.cpu.per_core_pct.size(); ++i)
      append("cpu." + std::to_string(i), t, s.cpu.per_core_pct[i]);
  }
  if (!degraded(s, "mem") && s.memory.total > 0) {
    append("mem.used_pct", t, 100.0 * static_cast<double>(s.memory.used) / static_cast<double>(s.memory.total));
    append("mem.used_bytes", t, static_cast<double>(s.memory.used));
  }
  if (!degraded(s, "mem") && s.memory.swap_total > 0) {
    append("swap.used_pct", t,
           100.0 * static_cast<double>(s.memory.swap_used) / static_cast<double>(s.memory.swap_total));
  }
  if (prev && dt > 0.0 && !degraded(s, "net") && !degraded(*prev, "net")) {
    append("net.rx_bps", t, counter_rate(prev->network.rx_bytes_total, s.network.rx_bytes_total, dt));
    append("net.tx_bps", t, counter_rate(prev->network.tx_bytes_total, s.network.tx_bytes_total, dt));
  }
  if (prev && dt > 0.0) {
    for (const auto& d : s.disks) {
      auto it = std::find_if(prev->disks.begin(), prev->disks.end(),
                             [&](const auto& p) { return p.name == d.name; });
      if (it == prev->disks.end()) continue;
      append("disk." + d.name + ".read_bps", t, counter_rate(it->read_bytes_total, d.read_bytes_total, dt));
      append("disk." + d.name + ".write_bps", t, counter_rate(it->write_bytes_total, d.write_bytes_total, dt));
    }
  }
  for (const auto& tr : s.temperatures)
    append("temp." + tr.sensor_name, t, vigil::util::convert_celsius(tr.celsius, cfg_.temp_unit));

  // One scaler tick per metric per snapshot, over the current window
  for (const auto& m : touched_) scaler_for(m).update(history_.range(m, t - window_s_, t));
}

double Dashboard::anchor_time() const {
  const Snapshot* s = frozen_ && frozen_snap_ ? frozen_snap_.get() : latest_.get();
  return s ? vigil::model::to_seconds(s->timestamp) : 0.0;
}

AxisBounds Dashboard::graph_bounds(std::string_view metric, double window_s) const {
  const double t = anchor_time();
  if (!frozen_ && window_s == window_s_) {
    auto it = scalers_.find(std::string(metric));
    if (it != scalers_.end()) return it->second.current();
  }
  return AdaptiveScaler::fit(ladder_for(metric), finite_max(history_.range(metric, t - window_s, t)),
                             cfg_.graph_headroom, cfg_.graph_divisions);
}

SeriesView Dashboard::history_slice(std::string_view metric, double window_s) const {
  if (!latest_) return {};
  const double t = anchor_time();
  return history_.range(metric, t - window_s, t);
}

TerminationReport Dashboard::submit_kill(const Selection& sel, int signal) {
  (void)refresh();
  static const Snapshot kEmpty{};
  const Snapshot& live = latest_ ? *latest_ : kEmpty;
  const Query* filter = query_.empty() ? nullptr : &query_;
  return terminator_.execute(terminator_.resolve(sel, live, filter, &rates_), signal);
}

std::optional<ParseError> Dashboard::set_query(std::string_view text) {
  query_text_ = std::string(text);
  Query q;
  ParseError err;
  if (!parse_query(text, search_, q, err)) {
    query_error_ = err;
    return err;
  }
  query_ = std::move(q);
  query_error_.reset();
  return std::nullopt;
}

std::optional<ParseError> Dashboard::set_search_options(const QueryOptions& opts) {
  search_ = opts;
  return set_query(query_text_);
}

void Dashboard::set_sort(SortColumn column, SortDirection direction) {
  sort_ = SortState{column, direction};
}

double Dashboard::set_window(double seconds) {
  if (!(seconds > 0.0)) return window_s_;
  window_s_ = std::min(seconds, history_.retention());
  return window_s_;
}

void Dashboard::set_frozen(bool on) {
  if (on == frozen_) return;
  frozen_ = on;
  if (on) {
    frozen_snap_ = latest_;
    frozen_rates_ = rates_;
  } else {
    frozen_snap_.reset();
  }
}

void Dashboard::toggle_collapsed(int32_t pid) {
  if (!collapsed_.erase(pid)) collapsed_.insert(pid);
}

void Dashboard::reset() {
  history_.reset();
  scalers_.clear();
  rates_.reset();
  frozen_rates_.reset();
  touched_.clear();
}

bool Dashboard::stale() const {
  if (channel_ && channel_->failing()) return true;
  if (!latest_) return false;
  return vigil::model::Clock::now() - last_arrival_ > cfg_.stale_after;
}

ProcessListing Dashboard::current_view(std::string_view query_text, const SortState& st, bool tree_mode) {
  if (query_text != query_text_) (void)set_query(query_text);
  sort_ = st;
  tree_ = tree_mode;
  return current_view();
}

ProcessListing Dashboard::current_view() {
  const Snapshot* s = frozen_ && frozen_snap_ ? frozen_snap_.get() : latest_.get();
  const ProcessRateTracker& rates = frozen_ && frozen_snap_ ? frozen_rates_ : rates_;
  ProcessListing out;
  if (s) {
    if (tree_) out = build_tree(*s, rates);
    else if (grouped_) out = build_grouped(*s, rates);
    else out = build_flat(*s, rates);
    out.total_processes = s->processes.size();
    out.snapshot_seq = s->seq;
  } else {
    out.mode = tree_ ? ViewMode::Tree : (grouped_ ? ViewMode::Grouped : ViewMode::Flat);
  }
  out.query_error = query_error_;
  out.stale = stale();
  out.frozen = frozen_;
  return out;
}

ProcessListing Dashboard::build_flat(const Snapshot& s, const ProcessRateTracker& rates) const {
  ProcessListing out;
  out.mode = ViewMode::Flat;
  out.rows.reserve(s.processes.size());
  for (const auto& p : s.processes) {
    IoRates io = rates.rates(p.pid);
    if (query_.matches(p, io)) out.rows.push_back(row_from(p, io));
  }
  sort_flat(out.rows, sort_);
  return out;
}

ProcessListing Dashboard::build_grouped(const Snapshot& s, const ProcessRateTracker& rates) const {
  ProcessListing out;
  out.mode = ViewMode::Grouped;
  auto groups = group_processes(s, group_by_command_, &rates, query_.empty() ? nullptr : &query_);
  out.rows.reserve(groups.size());
  for (auto& g : groups) {
    ProcessRow row;
    row.pid = g.member_pids.front();
    row.name = g.name;
    row.command = g.key;
    row.cpu_percent = g.total_cpu_percent;
    row.mem_percent = g.total_mem_percent;
    row.mem_bytes = g.total_mem_bytes;
    row.io = g.io;
    row.read_bytes_total = g.read_bytes_total;
    row.write_bytes_total = g.write_bytes_total;
    row.count = g.count;
    row.member_pids = std::move(g.member_pids);
    out.rows.push_back(std::move(row));
  }
  sort_grouped(out.rows, sort_);
  return out;
}

ProcessListing Dashboard::build_tree(const Snapshot& s, const ProcessRateTracker& rates) const {
  ProcessListing out;
  out.mode = ViewMode::Tree;
  auto tree = ProcessTree::build(s);
  (void)tree.apply_filter(query_, &rates);
  tree.set_collapsed(collapsed_);
  sort_tree(tree, sort_, &rates);
  auto entries = tree.flatten();
  out.rows.reserve(entries.size());
  for (const auto& e : entries) {
    const auto& n = tree.node(e.index);
    ProcessRow row = row_from(*n.record, rates.rates(n.pid));
    row.depth = e.depth;
    row.matched = n.matched;
    row.collapsed = n.collapsed;
    row.has_children = !n.children.empty();
    if (n.collapsed) {
      row.cpu_percent = n.subtree_cpu;
      row.mem_percent = n.subtree_mem_percent;
      row.mem_bytes = n.subtree_mem_bytes;
    }
    out.rows.push_back(std::move(row));
  }
  return out;
}

} // namespace vigil::app
