#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include "app/ProcessTree.hpp"
#include "app/ProcessView.hpp"

namespace vigil::app {

class ProcessRateTracker;

enum class SortColumn {
  Pid, Name, Command, User, State,
  Cpu, Mem, MemBytes, ReadRate, WriteRate, ReadTotal, WriteTotal,
  Count // meaningful in grouped mode; all rows tie elsewhere
};

enum class SortDirection { Ascending, Descending };

struct SortState {
  SortColumn column{SortColumn::Cpu};
  SortDirection direction{SortDirection::Descending};
};

const char* sort_column_name(SortColumn c);
std::optional<SortColumn> parse_sort_column(std::string_view s);

// Total order over doubles: NaN sorts below every number and equal to NaN.
int compare_total(double a, double b);

// Direction applies to the column only; ties always resolve ascending by pid.
void sort_flat(std::vector<ProcessRow>& rows, const SortState& st);
// Ties resolve by name (case-insensitive) then by lowest member pid.
void sort_grouped(std::vector<ProcessRow>& rows, const SortState& st);
// Sorts every child list independently; nodes never leave their parent and
// the synthetic root is never moved.
void sort_tree(ProcessTree& tree, const SortState& st, const ProcessRateTracker* rates);

} // namespace vigil::app
