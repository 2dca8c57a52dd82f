#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include "app/SnapshotChannel.hpp"
#include "collectors/ICollector.hpp"

namespace vigil::app {

// Background collection loop: polls the collector once per interval and
// publishes each complete snapshot into the channel.
class Producer {
public:
  Producer(std::unique_ptr<vigil::collectors::ICollector> collector,
           std::shared_ptr<SnapshotChannel> channel,
           std::chrono::milliseconds interval);
  ~Producer();
  Producer(const Producer&) = delete;
  Producer& operator=(const Producer&) = delete;

  // False if the collector refuses to initialize, or if an earlier stop
  // abandoned a worker that may still be inside the collector.
  bool start();
  // Request stop and wait up to `timeout`. A worker stuck inside poll() past
  // the deadline is detached and abandoned; returns false in that case.
  bool stop(std::chrono::milliseconds timeout);

  [[nodiscard]] bool running() const { return thread_.joinable(); }
  [[nodiscard]] uint64_t ticks() const;
  [[nodiscard]] uint64_t failures() const;

private:
  // Everything the worker touches. Shared so an abandoned worker never
  // outlives its state.
  struct Shared {
    std::unique_ptr<vigil::collectors::ICollector> collector;
    std::shared_ptr<SnapshotChannel> channel;
    std::chrono::milliseconds interval;
    std::mutex mu;
    std::condition_variable_any tick_cv;
    std::condition_variable done_cv;
    bool done{false};
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> failures{0};
  };

  static void run(std::stop_token st, std::shared_ptr<Shared> sh);

  std::shared_ptr<Shared> shared_;
  std::jthread thread_{};
  bool abandoned_{false};
  std::chrono::milliseconds default_timeout_{2000};
};

} // namespace vigil::app
