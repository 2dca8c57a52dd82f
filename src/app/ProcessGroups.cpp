#include "app/ProcessGroups.hpp"

#include <algorithm>
#include <unordered_map>
#include "app/Rates.hpp"

namespace vigil::app {

const std::string& group_key(const vigil::model::ProcessRecord& r, bool by_command) {
  if (by_command && !r.command_line.empty()) return r.command_line;
  return r.name;
}

std::vector<GroupedProcess> group_processes(const vigil::model::Snapshot& s, bool by_command,
                                            const ProcessRateTracker* rates, const Query* filter) {
  std::vector<GroupedProcess> groups;
  std::unordered_map<std::string_view, size_t> slot;
  slot.reserve(s.processes.size());
  for (const auto& p : s.processes) {
    IoRates io = rates ? rates->rates(p.pid) : IoRates{};
    if (filter && !filter->matches(p, io)) continue;
    const std::string& key = group_key(p, by_command);
    auto [it, inserted] = slot.try_emplace(std::string_view(key), groups.size());
    if (inserted) {
      GroupedProcess g;
      g.key = key;
      g.name = p.name;
      groups.push_back(std::move(g));
    }
    auto& g = groups[it->second];
    g.total_cpu_percent += p.cpu_percent;
    g.total_mem_percent += p.mem_percent;
    g.total_mem_bytes += p.mem_bytes;
    g.read_bytes_total += p.read_bytes_total;
    g.write_bytes_total += p.write_bytes_total;
    if (io.valid) {
      g.io.valid = true;
      g.io.read_per_sec += io.read_per_sec;
      g.io.write_per_sec += io.write_per_sec;
    }
    ++g.count;
    g.member_pids.push_back(p.pid);
  }
  for (auto& g : groups) std::sort(g.member_pids.begin(), g.member_pids.end());
  return groups;
}

} // namespace vigil::app
