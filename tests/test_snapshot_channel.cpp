#include "minitest.hpp"
#include "app/SnapshotChannel.hpp"
#include "fixtures.hpp"
#include <thread>

using fixtures::proc;

TEST(channel_empty_take_returns_nothing) {
  vigil::app::SnapshotChannel ch;
  ASSERT_TRUE(!ch.try_take().has_value());
  ASSERT_EQ(ch.published(), 0u);
}

TEST(channel_latest_publish_wins) {
  vigil::app::SnapshotChannel ch;
  ch.publish(fixtures::snapshot(1.0, {proc(1, std::nullopt, "a")}));
  ch.publish(fixtures::snapshot(2.0, {proc(2, std::nullopt, "b")}));
  ch.publish(fixtures::snapshot(3.0, {proc(3, std::nullopt, "c")}));
  auto s = ch.try_take();
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->seq, 3u);
  ASSERT_EQ(s->processes.front().pid, 3);
  ASSERT_EQ(ch.dropped(), 2u);
  ASSERT_TRUE(!ch.try_take().has_value());
}

TEST(channel_snapshot_arrives_whole) {
  vigil::app::SnapshotChannel ch;
  constexpr int kTicks = 200;
  std::thread producer([&] {
    for (int i = 1; i <= kTicks; ++i) {
      std::vector<vigil::model::ProcessRecord> procs;
      for (int p = 1; p <= 50; ++p) procs.push_back(proc(p, std::nullopt, "p", static_cast<double>(i)));
      ch.publish(fixtures::snapshot(static_cast<double>(i), std::move(procs)));
    }
  });
  uint64_t last_seq = 0;
  int seen = 0;
  while (last_seq < kTicks) {
    auto s = ch.try_take();
    if (!s) {
      std::this_thread::yield();
      continue;
    }
    ASSERT_TRUE(s->seq > last_seq);
    ASSERT_EQ(s->processes.size(), 50u);
    // Every record in a snapshot comes from the same tick
    for (const auto& p : s->processes) ASSERT_EQ(p.cpu_percent, static_cast<double>(s->seq));
    last_seq = s->seq;
    ++seen;
  }
  producer.join();
  ASSERT_TRUE(seen >= 1);
  ASSERT_EQ(ch.published(), static_cast<uint64_t>(kTicks));
}

TEST(channel_failing_flag_round_trips) {
  vigil::app::SnapshotChannel ch;
  ASSERT_TRUE(!ch.failing());
  ch.set_failing(true);
  ASSERT_TRUE(ch.failing());
  ch.set_failing(false);
  ASSERT_TRUE(!ch.failing());
}
