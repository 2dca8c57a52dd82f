#include "app/ProcessSort.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>
#include "app/Rates.hpp"
#include "util/AsciiLower.hpp"

namespace vigil::app {

namespace {

// Column values in comparable form, borrowed from a row or a tree node.
struct SortFields {
  int32_t pid;
  std::string_view name, command, user;
  vigil::model::ProcState state;
  double cpu, mem;
  uint64_t mem_bytes;
  IoRates io;
  uint64_t read_total, write_total;
  size_t count;
};

SortFields fields_of(const ProcessRow& r) {
  return SortFields{r.pid, r.name, r.command, r.user, r.state, r.cpu_percent, r.mem_percent,
                    r.mem_bytes, r.io, r.read_bytes_total, r.write_bytes_total, r.count};
}

SortFields fields_of(const vigil::model::ProcessRecord& r, const IoRates& io) {
  return SortFields{r.pid, r.name, r.command_line, r.user, r.state, r.cpu_percent, r.mem_percent,
                    r.mem_bytes, io, r.read_bytes_total, r.write_bytes_total, 1};
}

template <typename T>
int cmp3(T a, T b) { return a < b ? -1 : (b < a ? 1 : 0); }

double rate_or_nan(bool valid, double v) { return valid ? v : std::nan(""); }

int compare_column(const SortFields& a, const SortFields& b, SortColumn c) {
  using vigil::util::ascii_icompare;
  switch (c) {
    case SortColumn::Pid: return cmp3(a.pid, b.pid);
    case SortColumn::Name: return ascii_icompare(a.name, b.name);
    case SortColumn::Command: return ascii_icompare(a.command, b.command);
    case SortColumn::User: return ascii_icompare(a.user, b.user);
    case SortColumn::State:
      return ascii_icompare(vigil::model::state_name(a.state), vigil::model::state_name(b.state));
    case SortColumn::Cpu: return compare_total(a.cpu, b.cpu);
    case SortColumn::Mem: return compare_total(a.mem, b.mem);
    case SortColumn::MemBytes: return cmp3(a.mem_bytes, b.mem_bytes);
    case SortColumn::ReadRate:
      return compare_total(rate_or_nan(a.io.valid, a.io.read_per_sec), rate_or_nan(b.io.valid, b.io.read_per_sec));
    case SortColumn::WriteRate:
      return compare_total(rate_or_nan(a.io.valid, a.io.write_per_sec), rate_or_nan(b.io.valid, b.io.write_per_sec));
    case SortColumn::ReadTotal: return cmp3(a.read_total, b.read_total);
    case SortColumn::WriteTotal: return cmp3(a.write_total, b.write_total);
    case SortColumn::Count: return cmp3(a.count, b.count);
  }
  return 0;
}

int directed(int c, SortDirection d) { return d == SortDirection::Descending ? -c : c; }

struct ColumnDef { const char* name; SortColumn col; };
constexpr ColumnDef kColumns[] = {
  {"pid", SortColumn::Pid}, {"name", SortColumn::Name}, {"command", SortColumn::Command},
  {"cmd", SortColumn::Command}, {"user", SortColumn::User}, {"state", SortColumn::State},
  {"cpu", SortColumn::Cpu}, {"mem", SortColumn::Mem}, {"memb", SortColumn::MemBytes},
  {"read", SortColumn::ReadRate}, {"write", SortColumn::WriteRate},
  {"tread", SortColumn::ReadTotal}, {"twrite", SortColumn::WriteTotal}, {"count", SortColumn::Count},
};

} // namespace

const char* sort_column_name(SortColumn c) {
  for (const auto& d : kColumns)
    if (d.col == c) return d.name;
  return "?";
}

std::optional<SortColumn> parse_sort_column(std::string_view s) {
  for (const auto& d : kColumns)
    if (vigil::util::ascii_iequals(s, d.name)) return d.col;
  return std::nullopt;
}

int compare_total(double a, double b) {
  const bool na = std::isnan(a), nb = std::isnan(b);
  if (na || nb) return na == nb ? 0 : (na ? -1 : 1);
  return cmp3(a, b);
}

void sort_flat(std::vector<ProcessRow>& rows, const SortState& st) {
  std::stable_sort(rows.begin(), rows.end(), [&](const ProcessRow& a, const ProcessRow& b) {
    int c = directed(compare_column(fields_of(a), fields_of(b), st.column), st.direction);
    if (c != 0) return c < 0;
    return a.pid < b.pid;
  });
}

void sort_grouped(std::vector<ProcessRow>& rows, const SortState& st) {
  std::stable_sort(rows.begin(), rows.end(), [&](const ProcessRow& a, const ProcessRow& b) {
    int c = directed(compare_column(fields_of(a), fields_of(b), st.column), st.direction);
    if (c != 0) return c < 0;
    c = vigil::util::ascii_icompare(a.name, b.name);
    if (c != 0) return c < 0;
    return a.pid < b.pid;
  });
}

void sort_tree(ProcessTree& tree, const SortState& st, const ProcessRateTracker* rates) {
  std::vector<SortFields> keys;
  keys.reserve(tree.size());
  keys.push_back(SortFields{kSyntheticRootPid, {}, {}, {}, vigil::model::ProcState::Unknown,
                            0.0, 0.0, 0, IoRates{}, 0, 0, 0});
  for (size_t i = 1; i < tree.size(); ++i) {
    const auto& n = tree.node(i);
    keys.push_back(fields_of(*n.record, rates ? rates->rates(n.pid) : IoRates{}));
  }
  auto less = [&](size_t a, size_t b) {
    int c = directed(compare_column(keys[a], keys[b], st.column), st.direction);
    if (c != 0) return c < 0;
    return keys[a].pid < keys[b].pid;
  };
  for (size_t i = 0; i < tree.size(); ++i) {
    auto& ch = tree.children(i);
    if (ch.size() > 1) std::stable_sort(ch.begin(), ch.end(), less);
  }
}

} // namespace vigil::app
