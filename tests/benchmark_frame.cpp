#include "app/AdaptiveScaler.hpp"
#include "app/HistoryStore.hpp"
#include "app/ProcessGroups.hpp"
#include "app/ProcessSort.hpp"
#include "app/ProcessTree.hpp"
#include "app/Query.hpp"
#include "app/Rates.hpp"
#include "fixtures.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <random>
#include <vector>

using namespace vigil::app;
using BenchClock = std::chrono::high_resolution_clock;

static double ms_since(BenchClock::time_point t0) {
  return std::chrono::duration<double, std::milli>(BenchClock::now() - t0).count();
}

// Deep-ish random forest: each process hangs off one of the earlier ones.
static vigil::model::Snapshot make_snapshot(double secs, size_t n, std::mt19937& rng) {
  static const char* kNames[] = {"chrome", "bash", "python3", "postgres", "kworker/0:1", "sshd", "node", "rustc"};
  std::uniform_real_distribution<double> cpu(0.0, 25.0);
  std::uniform_int_distribution<uint64_t> mem(1u << 20, 2ull << 30);
  std::vector<vigil::model::ProcessRecord> procs;
  procs.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    int32_t pid = static_cast<int32_t>(i + 1);
    std::optional<int32_t> ppid;
    if (i > 0) ppid = static_cast<int32_t>(std::uniform_int_distribution<size_t>(1, i)(rng));
    auto r = fixtures::proc(pid, ppid, kNames[i % 8], cpu(rng), 0.0, mem(rng));
    r.mem_percent = static_cast<double>(r.mem_bytes) / static_cast<double>(64ull << 30) * 100.0;
    r.read_bytes_total = static_cast<uint64_t>(secs * 4096.0 * static_cast<double>(i % 17));
    procs.push_back(std::move(r));
  }
  return fixtures::snapshot(secs, std::move(procs));
}

int main() {
  constexpr size_t N = 5'000;
  constexpr int kFrames = 50;
  constexpr double kBudgetMs = 16.0;

  printf("=======================================================================\n");
  printf("  FRAME BENCHMARK: %zu PROCESSES, %d FRAMES\n", N, kFrames);
  printf("=======================================================================\n\n");

  std::mt19937 rng(42);
  ProcessRateTracker rates;
  HistoryStore history(600.0, 1.0);
  AdaptiveScaler scaler(LadderKind::Percent);

  Query q;
  ParseError err;
  if (!parse_query("(cpu > 5 and mem > 0.1) or name = bash or read > 1KiB", {}, q, err)) {
    printf("  ERROR: query rejected at %zu: %s\n", err.position, err.reason.c_str());
    return 1;
  }

  double worst_flat = 0, worst_group = 0, worst_tree = 0, total = 0;
  for (int f = 0; f < kFrames; ++f) {
    auto s = make_snapshot(static_cast<double>(f + 1), N, rng);
    rates.update(s);
    (void)history.append("cpu.avg", static_cast<double>(f + 1), s.cpu.average_pct);

    auto t0 = BenchClock::now();
    std::vector<ProcessRow> rows;
    rows.reserve(N);
    for (const auto& p : s.processes) {
      auto io = rates.rates(p.pid);
      if (!q.matches(p, io)) continue;
      ProcessRow r;
      r.pid = p.pid;
      r.name = p.name;
      r.cpu_percent = p.cpu_percent;
      r.mem_percent = p.mem_percent;
      r.io = io;
      rows.push_back(std::move(r));
    }
    sort_flat(rows, SortState{});
    double flat_ms = ms_since(t0);

    t0 = BenchClock::now();
    auto groups = group_processes(s, false, &rates, &q);
    double group_ms = ms_since(t0);

    t0 = BenchClock::now();
    auto tree = ProcessTree::build(s);
    (void)tree.apply_filter(q, &rates);
    sort_tree(tree, SortState{}, &rates);
    auto entries = tree.flatten();
    (void)scaler.update(history.range("cpu.avg", f + 1 - 60.0, f + 1));
    double tree_ms = ms_since(t0);

    worst_flat = std::max(worst_flat, flat_ms);
    worst_group = std::max(worst_group, group_ms);
    worst_tree = std::max(worst_tree, tree_ms);
    total += flat_ms + group_ms + tree_ms;
    if (f == 0) printf("  rows: flat %zu, groups %zu, tree %zu\n\n", rows.size(), groups.size(), entries.size());
  }

  printf("  %-28s %8.2f ms\n", "worst filter + flat sort:", worst_flat);
  printf("  %-28s %8.2f ms\n", "worst grouped aggregation:", worst_group);
  printf("  %-28s %8.2f ms\n", "worst tree + sort + scale:", worst_tree);
  printf("  %-28s %8.2f ms\n", "mean frame:", total / kFrames);

  double worst = worst_flat + worst_group + worst_tree;
  printf("\n  Budget %.1f ms: %s\n", kBudgetMs, worst <= kBudgetMs ? "OK" : "OVER");
  return 0;
}
