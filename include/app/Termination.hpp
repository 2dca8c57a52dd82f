#pragma once
#include <csignal>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "app/IProcessKiller.hpp"
#include "app/Query.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

class ProcessRateTracker;

struct Selection {
  enum class Kind { Process, Group, Subtree };

  Kind kind{Kind::Process};
  int32_t pid{0};          // Process, Subtree
  std::string group_key;   // Group
  bool by_command{false};  // Group: key is a command line

  static Selection process(int32_t pid) { return Selection{Kind::Process, pid, {}, false}; }
  static Selection subtree(int32_t pid) { return Selection{Kind::Subtree, pid, {}, false}; }
  static Selection group(std::string key, bool by_command = false) {
    return Selection{Kind::Group, 0, std::move(key), by_command};
  }
};

struct TerminationReport {
  std::vector<int32_t> succeeded;         // in attempt order
  std::map<int32_t, std::string> failed;  // pid -> reason

  [[nodiscard]] bool all_succeeded() const { return failed.empty(); }
};

class TerminationCoordinator {
public:
  explicit TerminationCoordinator(IProcessKiller& killer) : killer_(killer) {}

  // Targets for `sel` as of `live`, re-read rather than cached.
  //  Process: exactly that pid. Group: every live member passing `filter`
  //  (the filter the grouped row was built with), ascending.
  //  Subtree: the pid and its live descendants, children first.
  // Non-positive pids and the synthetic root never resolve.
  [[nodiscard]] std::vector<int32_t> resolve(const Selection& sel, const vigil::model::Snapshot& live,
                                             const Query* filter = nullptr,
                                             const ProcessRateTracker* rates = nullptr) const;

  // One request per distinct target. A failure (reported or thrown) on one
  // pid is recorded and the rest are still attempted.
  TerminationReport execute(const std::vector<int32_t>& targets, int signal = SIGTERM);

private:
  IProcessKiller& killer_;
};

} // namespace vigil::app
