#include "app/Producer.hpp"
#include <string>
#include "util/Log.hpp"

using namespace std::chrono;

namespace vigil::app {

Producer::Producer(std::unique_ptr<vigil::collectors::ICollector> collector,
                   std::shared_ptr<SnapshotChannel> channel,
                   milliseconds interval)
    : shared_(std::make_shared<Shared>()) {
  shared_->collector = std::move(collector);
  shared_->channel = std::move(channel);
  shared_->interval = interval.count() > 0 ? interval : milliseconds(1000);
}

Producer::~Producer() {
  if (running()) (void)stop(default_timeout_);
}

bool Producer::start() {
  if (running()) return true;
  if (!shared_->collector || !shared_->channel) return false;
  if (abandoned_) {
    VIGIL_LOG_ERROR("collector %s still owned by an abandoned worker; not restarting",
                    shared_->collector->name());
    return false;
  }
  if (!shared_->collector->init()) {
    VIGIL_LOG_ERROR("collector %s unavailable", shared_->collector->name());
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(shared_->mu);
    shared_->done = false;
  }
  auto sh = shared_;
  thread_ = std::jthread([sh](std::stop_token st) { run(st, sh); });
  return true;
}

bool Producer::stop(milliseconds timeout) {
  if (!thread_.joinable()) return true;
  thread_.request_stop();
  bool finished;
  {
    std::unique_lock<std::mutex> lk(shared_->mu);
    finished = shared_->done_cv.wait_for(lk, timeout, [&] { return shared_->done; });
  }
  if (finished) {
    thread_.join();
    return true;
  }
  VIGIL_LOG_WARN("collector %s did not stop within %lld ms; abandoning it",
                 shared_->collector->name(), static_cast<long long>(timeout.count()));
  thread_.detach();
  abandoned_ = true;
  return false;
}

uint64_t Producer::ticks() const { return shared_->ticks.load(std::memory_order_relaxed); }
uint64_t Producer::failures() const { return shared_->failures.load(std::memory_order_relaxed); }

void Producer::run(std::stop_token st, std::shared_ptr<Shared> sh) {
  bool failing = false;
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    vigil::model::Snapshot s;
    s.timestamp = vigil::model::Clock::now();
    std::string err;
    if (sh->collector->poll(s, err)) {
      if (failing) VIGIL_LOG_WARN("collector %s recovered", sh->collector->name());
      failing = false;
      sh->channel->set_failing(false);
      sh->channel->publish(std::move(s));
      sh->ticks.fetch_add(1, std::memory_order_relaxed);
    } else {
      // Total failure: keep the consumer on its previous snapshot
      if (!failing) VIGIL_LOG_WARN("collector %s failed: %s", sh->collector->name(), err.c_str());
      failing = true;
      sh->channel->set_failing(true);
      sh->failures.fetch_add(1, std::memory_order_relaxed);
    }

    next_due += sh->interval;
    auto now = steady_clock::now();
    if (next_due < now) next_due = now + sh->interval; // overran, do not burst
    std::unique_lock<std::mutex> lk(sh->mu);
    (void)sh->tick_cv.wait_until(lk, st, next_due, [] { return false; });
  }
  sh->collector->shutdown();
  {
    std::lock_guard<std::mutex> lk(sh->mu);
    sh->done = true;
  }
  sh->done_cv.notify_all();
}

} // namespace vigil::app
