#pragma once
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include "app/AdaptiveScaler.hpp"
#include "app/Config.hpp"
#include "app/HistoryStore.hpp"
#include "app/ProcessSort.hpp"
#include "app/ProcessView.hpp"
#include "app/Query.hpp"
#include "app/Rates.hpp"
#include "app/SnapshotChannel.hpp"
#include "app/Termination.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

// Control-thread session state: the latest snapshot, history, scalers and
// the user's filter/sort/view choices. Not thread-safe; everything here runs
// on the thread that renders. The collection thread only reaches it through
// the channel.
class Dashboard {
public:
  Dashboard(const EngineConfig& cfg, std::shared_ptr<SnapshotChannel> channel, IProcessKiller& killer);

  // Consume the newest published snapshot, if any. Never blocks.
  bool refresh();
  // Fold one snapshot into history and make it current. Throws
  // InvariantError on duplicate pids.
  void ingest(vigil::model::Snapshot s);

  // Process list for the presentation layer. A changed query text is
  // compiled first; if it fails the last valid filter stays in force and the
  // listing carries the error.
  ProcessListing current_view(std::string_view query_text, const SortState& st, bool tree_mode);
  ProcessListing current_view();

  [[nodiscard]] AxisBounds graph_bounds(std::string_view metric, double window_s) const;
  [[nodiscard]] SeriesView history_slice(std::string_view metric, double window_s) const;

  // Refreshes first so group membership is read from the newest tick. Group
  // members are narrowed by the filter in force, matching the grouped row.
  TerminationReport submit_kill(const Selection& sel, int signal = SIGTERM);

  std::optional<ParseError> set_query(std::string_view text);
  std::optional<ParseError> set_search_options(const QueryOptions& opts);
  void set_sort(SortColumn column, SortDirection direction);
  // Clamped to (0, retention]; returns the window in effect.
  double set_window(double seconds);
  void set_grouped(bool on) { grouped_ = on; }
  void set_group_by_command(bool on) { group_by_command_ = on; }
  void set_tree(bool on) { tree_ = on; }
  void set_frozen(bool on);
  void toggle_collapsed(int32_t pid);
  // Drop history, axis state and derived rates; keep the current snapshot.
  void reset();

  [[nodiscard]] bool stale() const;
  [[nodiscard]] bool frozen() const { return frozen_; }
  [[nodiscard]] double window() const { return window_s_; }
  [[nodiscard]] const SortState& sort() const { return sort_; }
  [[nodiscard]] const Query& query() const { return query_; }
  [[nodiscard]] const HistoryStore& history() const { return history_; }
  [[nodiscard]] const vigil::model::Snapshot* latest() const { return latest_.get(); }

  static LadderKind ladder_for(std::string_view metric);

private:
  void record_metrics(const vigil::model::Snapshot& s);
  void append(const std::string& metric, double t, double value);
  AdaptiveScaler& scaler_for(const std::string& metric);
  [[nodiscard]] double anchor_time() const;

  ProcessListing build_flat(const vigil::model::Snapshot& s, const ProcessRateTracker& rates) const;
  ProcessListing build_grouped(const vigil::model::Snapshot& s, const ProcessRateTracker& rates) const;
  ProcessListing build_tree(const vigil::model::Snapshot& s, const ProcessRateTracker& rates) const;

  EngineConfig cfg_;
  std::shared_ptr<SnapshotChannel> channel_;
  TerminationCoordinator terminator_;

  HistoryStore history_;
  std::unordered_map<std::string, AdaptiveScaler> scalers_;
  std::unordered_set<std::string> touched_; // metrics appended this tick
  ProcessRateTracker rates_;

  std::shared_ptr<const vigil::model::Snapshot> latest_;
  std::shared_ptr<const vigil::model::Snapshot> frozen_snap_;
  ProcessRateTracker frozen_rates_;
  vigil::model::Clock::time_point last_arrival_{};

  Query query_;
  std::optional<ParseError> query_error_;
  std::string query_text_;
  QueryOptions search_;
  SortState sort_;
  double window_s_;
  bool grouped_;
  bool group_by_command_;
  bool tree_;
  bool frozen_{false};
  std::unordered_set<int32_t> collapsed_;
};

} // namespace vigil::app
