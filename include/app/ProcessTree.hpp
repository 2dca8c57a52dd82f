#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "app/Query.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

class ProcessRateTracker;

// Parent of every process whose parent is missing from the snapshot. Not a
// real process: never sorted, never displayed, never a kill target.
inline constexpr int32_t kSyntheticRootPid = -1;

struct TreeNode {
  const vigil::model::ProcessRecord* record{nullptr}; // null for the root
  int32_t pid{kSyntheticRootPid};
  size_t parent{0};
  std::vector<size_t> children;
  bool matched{true};   // record itself passes the filter
  bool visible{true};   // matched, or has a matched descendant
  bool collapsed{false};
  double   subtree_cpu{};
  double   subtree_mem_percent{};
  uint64_t subtree_mem_bytes{};
};

// Parent/child forest over one snapshot, rooted at a synthetic node. Holds
// pointers into the snapshot, which must outlive the tree.
class ProcessTree {
public:
  // O(n). Missing, self or cyclic parents attach to the root. Throws
  // InvariantError if a pid appears twice.
  static ProcessTree build(const vigil::model::Snapshot& s);

  [[nodiscard]] size_t root() const { return 0; }
  [[nodiscard]] size_t size() const { return nodes_.size(); }
  [[nodiscard]] const TreeNode& node(size_t i) const { return nodes_[i]; }
  [[nodiscard]] std::vector<size_t>& children(size_t i) { return nodes_[i].children; }
  [[nodiscard]] std::optional<size_t> find(int32_t pid) const;

  // pid and all its descendants, every child before its parent.
  [[nodiscard]] std::vector<int32_t> subtree_pids(int32_t pid) const;

  // Marks matches and hides subtrees without any. Ancestors of a match stay
  // visible with matched = false. Returns the number of matching processes.
  size_t apply_filter(const Query& q, const ProcessRateTracker* rates);

  void set_collapsed(const std::unordered_set<int32_t>& pids);

  struct Entry {
    size_t index;
    int depth; // 0 for top-level processes
  };
  // Pre-order over visible nodes, skipping the root and anything below a
  // collapsed node.
  [[nodiscard]] std::vector<Entry> flatten() const;

private:
  std::vector<size_t> preorder() const;

  std::vector<TreeNode> nodes_;
  std::unordered_map<int32_t, size_t> index_;
};

// Throws InvariantError naming the first repeated pid.
void check_unique_pids(const vigil::model::Snapshot& s);

} // namespace vigil::app
