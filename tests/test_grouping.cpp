#include "minitest.hpp"
#include "app/ProcessGroups.hpp"
#include "app/Rates.hpp"
#include "fixtures.hpp"

using fixtures::proc;

TEST(group_sums_by_name_in_first_seen_order) {
  auto s = fixtures::snapshot(1.0, {proc(30, 1, "chrome", 10.0, 1.0, 100), proc(10, 1, "bash", 1.0, 0.5, 50),
                                    proc(20, 1, "chrome", 5.0, 2.0, 200), proc(40, 1, "chrome", 2.5, 0.5, 300)});
  auto g = vigil::app::group_processes(s, false);
  ASSERT_EQ(g.size(), 2u);
  ASSERT_EQ(g[0].key, "chrome");
  ASSERT_EQ(g[0].count, 3u);
  ASSERT_NEAR(g[0].total_cpu_percent, 17.5, 1e-9);
  ASSERT_NEAR(g[0].total_mem_percent, 3.5, 1e-9);
  ASSERT_EQ(g[0].total_mem_bytes, 600u);
  ASSERT_EQ(g[0].member_pids, (std::vector<int32_t>{20, 30, 40}));
  ASSERT_EQ(g[1].key, "bash");
  ASSERT_EQ(g[1].count, 1u);
}

TEST(group_by_command_splits_same_names) {
  auto a = proc(1, std::nullopt, "python");
  a.command_line = "python3 server.py";
  auto b = proc(2, std::nullopt, "python");
  b.command_line = "python3 worker.py";
  auto c = proc(3, std::nullopt, "python");
  c.command_line = "";
  auto s = fixtures::snapshot(1.0, {a, b, c});
  ASSERT_EQ(vigil::app::group_processes(s, false).size(), 1u);
  auto g = vigil::app::group_processes(s, true);
  ASSERT_EQ(g.size(), 3u);
  ASSERT_EQ(g[2].key, "python"); // empty command falls back to name
}

TEST(group_is_recomputed_from_each_snapshot) {
  auto s1 = fixtures::snapshot(1.0, {proc(1, std::nullopt, "w", 1.0), proc(2, std::nullopt, "w", 1.0)});
  auto s2 = fixtures::snapshot(2.0, {proc(2, std::nullopt, "w", 3.0), proc(3, std::nullopt, "w", 3.0)});
  auto g1 = vigil::app::group_processes(s1, false);
  auto g2 = vigil::app::group_processes(s2, false);
  ASSERT_EQ(g1[0].member_pids, (std::vector<int32_t>{1, 2}));
  ASSERT_EQ(g2[0].member_pids, (std::vector<int32_t>{2, 3}));
  ASSERT_NEAR(g2[0].total_cpu_percent, 6.0, 1e-12);
}

TEST(group_counts_only_filtered_members) {
  auto s = fixtures::snapshot(1.0, {proc(1, std::nullopt, "nginx", 0.0), proc(2, std::nullopt, "nginx", 9.0),
                                    proc(3, std::nullopt, "nginx", 12.0)});
  vigil::app::Query q;
  vigil::app::ParseError err;
  ASSERT_TRUE(vigil::app::parse_query("cpu > 5", {}, q, err));
  auto g = vigil::app::group_processes(s, false, nullptr, &q);
  ASSERT_EQ(g.size(), 1u);
  ASSERT_EQ(g[0].count, 2u);
  ASSERT_EQ(g[0].member_pids, (std::vector<int32_t>{2, 3}));
}

TEST(group_sums_io_rates_of_members_with_history) {
  auto p1 = proc(1, std::nullopt, "dd");
  auto p2 = proc(2, std::nullopt, "dd");
  auto s1 = fixtures::snapshot(10.0, {p1, p2});
  p1.read_bytes_total = 1000;
  p2.read_bytes_total = 3000;
  auto s2 = fixtures::snapshot(12.0, {p1, p2});
  vigil::app::ProcessRateTracker rt;
  rt.update(s1);
  rt.update(s2);
  auto g = vigil::app::group_processes(s2, false, &rt);
  ASSERT_TRUE(g[0].io.valid);
  ASSERT_NEAR(g[0].io.read_per_sec, 2000.0, 1e-6);
  ASSERT_EQ(g[0].read_bytes_total, 4000u);
}
