#include "app/ProcessTree.hpp"

#include <string>
#include "app/Rates.hpp"

namespace vigil::app {

void check_unique_pids(const vigil::model::Snapshot& s) {
  std::unordered_set<int32_t> seen;
  seen.reserve(s.processes.size());
  for (const auto& p : s.processes) {
    if (!seen.insert(p.pid).second)
      throw vigil::model::InvariantError("snapshot " + std::to_string(s.seq) + ": duplicate pid " + std::to_string(p.pid));
  }
}

ProcessTree ProcessTree::build(const vigil::model::Snapshot& s) {
  ProcessTree t;
  const size_t n = s.processes.size();
  t.nodes_.resize(n + 1);
  t.index_.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const auto& rec = s.processes[i];
    if (!t.index_.emplace(rec.pid, i + 1).second)
      throw vigil::model::InvariantError("snapshot " + std::to_string(s.seq) + ": duplicate pid " + std::to_string(rec.pid));
    auto& node = t.nodes_[i + 1];
    node.record = &rec;
    node.pid = rec.pid;
  }

  for (size_t i = 1; i <= n; ++i) {
    auto& node = t.nodes_[i];
    node.parent = 0;
    const auto& ppid = node.record->parent_pid;
    if (!ppid || *ppid == node.pid) continue;
    auto it = t.index_.find(*ppid);
    if (it != t.index_.end()) node.parent = it->second;
  }

  // Break parent cycles: walk each unvisited chain upward; reaching a node
  // already on the current path means the last step closes a loop.
  enum : uint8_t { kNew, kOnPath, kDone };
  std::vector<uint8_t> state(n + 1, kNew);
  state[0] = kDone;
  std::vector<size_t> path;
  for (size_t i = 1; i <= n; ++i) {
    if (state[i] != kNew) continue;
    path.clear();
    size_t cur = i;
    while (state[cur] == kNew) {
      state[cur] = kOnPath;
      path.push_back(cur);
      cur = t.nodes_[cur].parent;
    }
    if (state[cur] == kOnPath) t.nodes_[path.back()].parent = 0;
    for (size_t p : path) state[p] = kDone;
  }

  for (size_t i = 1; i <= n; ++i) t.nodes_[t.nodes_[i].parent].children.push_back(i);

  // Children precede parents in reversed pre-order
  auto order = t.preorder();
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    auto& node = t.nodes_[*it];
    if (node.record) {
      node.subtree_cpu += node.record->cpu_percent;
      node.subtree_mem_percent += node.record->mem_percent;
      node.subtree_mem_bytes += node.record->mem_bytes;
    }
    if (*it != 0) {
      auto& parent = t.nodes_[node.parent];
      parent.subtree_cpu += node.subtree_cpu;
      parent.subtree_mem_percent += node.subtree_mem_percent;
      parent.subtree_mem_bytes += node.subtree_mem_bytes;
    }
  }
  return t;
}

std::vector<size_t> ProcessTree::preorder() const {
  std::vector<size_t> order;
  order.reserve(nodes_.size());
  std::vector<size_t> stack{0};
  while (!stack.empty()) {
    size_t i = stack.back();
    stack.pop_back();
    order.push_back(i);
    const auto& ch = nodes_[i].children;
    for (auto it = ch.rbegin(); it != ch.rend(); ++it) stack.push_back(*it);
  }
  return order;
}

std::optional<size_t> ProcessTree::find(int32_t pid) const {
  auto it = index_.find(pid);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::vector<int32_t> ProcessTree::subtree_pids(int32_t pid) const {
  std::vector<int32_t> out;
  auto start = find(pid);
  if (!start) return out;
  // Iterative post-order
  std::vector<std::pair<size_t, size_t>> stack{{*start, 0}};
  while (!stack.empty()) {
    auto& [idx, next_child] = stack.back();
    const auto& ch = nodes_[idx].children;
    if (next_child < ch.size()) {
      size_t c = ch[next_child++];
      stack.emplace_back(c, 0);
    } else {
      out.push_back(nodes_[idx].pid);
      stack.pop_back();
    }
  }
  return out;
}

size_t ProcessTree::apply_filter(const Query& q, const ProcessRateTracker* rates) {
  size_t matched = 0;
  if (q.empty()) {
    for (auto& n : nodes_) { n.matched = true; n.visible = true; }
    return nodes_.size() - 1;
  }
  for (auto& n : nodes_) n.visible = false;
  auto order = preorder();
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    auto& node = nodes_[*it];
    if (*it == 0) {
      node.matched = true;
      node.visible = true;
      break;
    }
    IoRates io = rates ? rates->rates(node.pid) : IoRates{};
    node.matched = q.matches(*node.record, io);
    if (node.matched) ++matched;
    if (node.matched || node.visible) {
      node.visible = true;
      nodes_[node.parent].visible = true;
    }
  }
  return matched;
}

void ProcessTree::set_collapsed(const std::unordered_set<int32_t>& pids) {
  for (size_t i = 1; i < nodes_.size(); ++i) nodes_[i].collapsed = pids.contains(nodes_[i].pid);
}

std::vector<ProcessTree::Entry> ProcessTree::flatten() const {
  std::vector<Entry> out;
  out.reserve(nodes_.size());
  std::vector<Entry> stack;
  const auto& top = nodes_[0].children;
  for (auto it = top.rbegin(); it != top.rend(); ++it) stack.push_back({*it, 0});
  while (!stack.empty()) {
    Entry e = stack.back();
    stack.pop_back();
    const auto& node = nodes_[e.index];
    if (!node.visible) continue;
    out.push_back(e);
    if (node.collapsed) continue;
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) stack.push_back({*it, e.depth + 1});
  }
  return out;
}

} // namespace vigil::app
