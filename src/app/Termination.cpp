#include "app/Termination.hpp"

#include <algorithm>
#include <exception>
#include <unordered_set>
#include "app/ProcessGroups.hpp"
#include "app/ProcessTree.hpp"
#include "app/Rates.hpp"
#include "util/Log.hpp"

namespace vigil::app {

std::vector<int32_t> TerminationCoordinator::resolve(const Selection& sel, const vigil::model::Snapshot& live,
                                                     const Query* filter, const ProcessRateTracker* rates) const {
  std::vector<int32_t> out;
  switch (sel.kind) {
    case Selection::Kind::Process:
      if (sel.pid > 0) out.push_back(sel.pid);
      break;
    case Selection::Kind::Group:
      for (const auto& p : live.processes) {
        if (p.pid <= 0 || group_key(p, sel.by_command) != sel.group_key) continue;
        if (filter && !filter->matches(p, rates ? rates->rates(p.pid) : IoRates{})) continue;
        out.push_back(p.pid);
      }
      std::sort(out.begin(), out.end());
      break;
    case Selection::Kind::Subtree: {
      if (sel.pid <= 0) break;
      auto tree = ProcessTree::build(live);
      if (!tree.find(sel.pid)) {
        out.push_back(sel.pid);
        break;
      }
      out = tree.subtree_pids(sel.pid);
      break;
    }
  }
  return out;
}

TerminationReport TerminationCoordinator::execute(const std::vector<int32_t>& targets, int signal) {
  TerminationReport rep;
  std::unordered_set<int32_t> attempted;
  for (int32_t pid : targets) {
    if (!attempted.insert(pid).second) continue;
    if (pid <= 0) {
      rep.failed[pid] = "not a process id";
      continue;
    }
    KillResult res;
    try {
      res = killer_.terminate(pid, signal);
    } catch (const std::exception& e) {
      res = KillResult{false, e.what()};
    }
    if (res.success) {
      rep.succeeded.push_back(pid);
    } else {
      if (res.error_message.empty()) res.error_message = "termination failed";
      VIGIL_LOG_INFO("signal %d to pid %d failed: %s", signal, pid, res.error_message.c_str());
      rep.failed[pid] = std::move(res.error_message);
    }
  }
  return rep;
}

} // namespace vigil::app
