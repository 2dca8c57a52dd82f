#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include "model/Snapshot.hpp"

namespace vigil::app {

// Single-producer/single-consumer handoff of whole snapshots. The slot holds
// at most one snapshot; publishing over an unconsumed one replaces it, so the
// consumer always sees the newest tick. Ownership moves with the pointer.
class SnapshotChannel {
public:
  SnapshotChannel() = default;
  ~SnapshotChannel();
  SnapshotChannel(const SnapshotChannel&) = delete;
  SnapshotChannel& operator=(const SnapshotChannel&) = delete;

  // Producer side. Stamps s.seq and makes it visible in one atomic step.
  void publish(vigil::model::Snapshot&& s);

  // Consumer side. Never blocks; nullopt if nothing new since the last take.
  [[nodiscard]] std::optional<vigil::model::Snapshot> try_take();

  [[nodiscard]] uint64_t published() const { return seq_.load(std::memory_order_acquire); }
  // Snapshots replaced before the consumer took them
  [[nodiscard]] uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

  // Set by the producer while every poll fails outright
  void set_failing(bool v) { failing_.store(v, std::memory_order_release); }
  [[nodiscard]] bool failing() const { return failing_.load(std::memory_order_acquire); }

private:
  alignas(64) std::atomic<vigil::model::Snapshot*> slot_{nullptr};
  std::atomic<uint64_t> seq_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<bool> failing_{false};
};

} // namespace vigil::app
