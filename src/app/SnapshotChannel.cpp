#include "app/SnapshotChannel.hpp"

namespace vigil::app {

SnapshotChannel::~SnapshotChannel() {
  delete slot_.exchange(nullptr, std::memory_order_acquire);
}

void SnapshotChannel::publish(vigil::model::Snapshot&& s) {
  s.seq = seq_.load(std::memory_order_relaxed) + 1;
  auto* fresh = new vigil::model::Snapshot(std::move(s));
  auto* stale = slot_.exchange(fresh, std::memory_order_acq_rel);
  seq_.store(fresh->seq, std::memory_order_release);
  if (stale) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    delete stale;
  }
}

std::optional<vigil::model::Snapshot> SnapshotChannel::try_take() {
  auto* p = slot_.exchange(nullptr, std::memory_order_acq_rel);
  if (!p) return std::nullopt;
  std::optional<vigil::model::Snapshot> out(std::move(*p));
  delete p;
  return out;
}

} // namespace vigil::app
