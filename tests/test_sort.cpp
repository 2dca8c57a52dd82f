#include "minitest.hpp"
#include "app/ProcessSort.hpp"
#include <cmath>
#include <limits>

using vigil::app::ProcessRow;
using vigil::app::SortColumn;
using vigil::app::SortDirection;

static ProcessRow row(int32_t pid, std::string name, double cpu = 0.0, size_t count = 1) {
  ProcessRow r;
  r.pid = pid;
  r.name = std::move(name);
  r.cpu_percent = cpu;
  r.count = count;
  return r;
}

static std::vector<int32_t> pids(const std::vector<ProcessRow>& rows) {
  std::vector<int32_t> out;
  for (const auto& r : rows) out.push_back(r.pid);
  return out;
}

static std::vector<size_t> counts(const std::vector<ProcessRow>& rows) {
  std::vector<size_t> out;
  for (const auto& r : rows) out.push_back(r.count);
  return out;
}

TEST(sort_grouped_by_count_uses_numeric_count) {
  std::vector<ProcessRow> rows{row(10, "a", 0, 1), row(20, "b", 0, 3), row(30, "c", 0, 2)};
  vigil::app::sort_grouped(rows, {SortColumn::Count, SortDirection::Descending});
  ASSERT_EQ(counts(rows), (std::vector<size_t>{3, 2, 1}));
  vigil::app::sort_grouped(rows, {SortColumn::Count, SortDirection::Ascending});
  ASSERT_EQ(counts(rows), (std::vector<size_t>{1, 2, 3}));
}

TEST(sort_grouped_count_beyond_nine_is_not_lexical) {
  std::vector<ProcessRow> rows{row(1, "a", 0, 9), row(2, "b", 0, 10), row(3, "c", 0, 100)};
  vigil::app::sort_grouped(rows, {SortColumn::Count, SortDirection::Descending});
  ASSERT_EQ(counts(rows), (std::vector<size_t>{100, 10, 9}));
}

TEST(sort_grouped_ties_break_by_name_then_first_pid) {
  std::vector<ProcessRow> rows{row(5, "zsh", 0, 2), row(9, "Bash", 0, 2), row(3, "bash", 0, 2), row(1, "awk", 0, 2)};
  vigil::app::sort_grouped(rows, {SortColumn::Count, SortDirection::Descending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{1, 3, 9, 5}));
  // Direction never flips the tie-break
  vigil::app::sort_grouped(rows, {SortColumn::Count, SortDirection::Ascending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{1, 3, 9, 5}));
}

TEST(sort_flat_ties_break_by_pid_ascending) {
  std::vector<ProcessRow> rows{row(7, "a", 5.0), row(3, "b", 5.0), row(9, "c", 1.0), row(1, "d", 5.0)};
  vigil::app::sort_flat(rows, {SortColumn::Cpu, SortDirection::Descending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{1, 3, 7, 9}));
  vigil::app::sort_flat(rows, {SortColumn::Cpu, SortDirection::Ascending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{9, 1, 3, 7}));
}

TEST(sort_count_in_flat_view_falls_back_to_pid) {
  std::vector<ProcessRow> rows{row(3, "a"), row(1, "b"), row(2, "c")};
  vigil::app::sort_flat(rows, {SortColumn::Count, SortDirection::Descending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{1, 2, 3}));
}

TEST(sort_nan_is_below_every_number) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  ASSERT_EQ(vigil::app::compare_total(nan, -1e300), -1);
  ASSERT_EQ(vigil::app::compare_total(0.0, nan), 1);
  ASSERT_EQ(vigil::app::compare_total(nan, nan), 0);
  std::vector<ProcessRow> rows{row(1, "a", nan), row(2, "b", 3.0), row(3, "c", nan), row(4, "d", -0.5)};
  vigil::app::sort_flat(rows, {SortColumn::Cpu, SortDirection::Descending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{2, 4, 1, 3}));
  vigil::app::sort_flat(rows, {SortColumn::Cpu, SortDirection::Ascending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{1, 3, 4, 2}));
}

TEST(sort_string_columns_ignore_case) {
  std::vector<ProcessRow> rows{row(1, "beta"), row(2, "Alpha"), row(3, "alpha2")};
  vigil::app::sort_flat(rows, {SortColumn::Name, SortDirection::Ascending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{2, 3, 1}));
}

TEST(sort_rates_without_history_sort_lowest) {
  auto a = row(1, "a");
  auto b = row(2, "b");
  b.io = vigil::app::IoRates{true, 0.0, 0.0};
  std::vector<ProcessRow> rows{a, b};
  vigil::app::sort_flat(rows, {SortColumn::ReadRate, SortDirection::Descending});
  ASSERT_EQ(pids(rows), (std::vector<int32_t>{2, 1}));
}

TEST(sort_column_names_parse) {
  ASSERT_TRUE(vigil::app::parse_sort_column("CPU") == SortColumn::Cpu);
  ASSERT_TRUE(vigil::app::parse_sort_column("count") == SortColumn::Count);
  ASSERT_TRUE(vigil::app::parse_sort_column("cmd") == SortColumn::Command);
  ASSERT_TRUE(!vigil::app::parse_sort_column("gpu").has_value());
  ASSERT_EQ(std::string(vigil::app::sort_column_name(SortColumn::MemBytes)), "memb");
}
