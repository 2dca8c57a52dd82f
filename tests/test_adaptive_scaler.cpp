#include "minitest.hpp"
#include "app/AdaptiveScaler.hpp"
#include "app/HistoryStore.hpp"
#include <cmath>

using vigil::app::AdaptiveScaler;
using vigil::app::LadderKind;

static constexpr double KiB = 1024.0;
static constexpr double MiB = 1024.0 * 1024.0;
static constexpr double GiB = MiB * 1024.0;

TEST(scaler_sub_mib_series_gets_mib_scale_rung) {
  vigil::app::HistoryStore h(60.0, 1.0);
  double vals[] = {300 * KiB, 620 * KiB, 900 * KiB, 410 * KiB};
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  vigil::app::AxisBounds b{};
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(h.append("net.rx_bps", i, vals[i]));
    b = sc.update(h.range("net.rx_bps", i - 60.0, i));
  }
  ASSERT_NEAR(b.lower, 0.0, 0.0);
  ASSERT_NEAR(b.upper, MiB, 0.0);
  ASSERT_TRUE(b.upper < GiB);
  ASSERT_NEAR(b.step, MiB / 4, 0.0);
}

TEST(scaler_grows_on_the_next_tick_after_a_spike) {
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  ASSERT_NEAR(sc.update(900 * KiB).upper, MiB, 0.0);
  ASSERT_NEAR(sc.update(5 * MiB).upper, 8 * MiB, 0.0);
}

TEST(scaler_shrinks_only_after_hysteresis_ticks) {
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  ASSERT_NEAR(sc.update(5 * MiB).upper, 8 * MiB, 0.0);
  ASSERT_NEAR(sc.update(900 * KiB).upper, 8 * MiB, 0.0);
  ASSERT_NEAR(sc.update(900 * KiB).upper, 8 * MiB, 0.0);
  ASSERT_NEAR(sc.update(900 * KiB).upper, MiB, 0.0);
}

TEST(scaler_interrupted_quiet_period_restarts_count) {
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  sc.update(5 * MiB);
  sc.update(900 * KiB);
  sc.update(900 * KiB);
  sc.update(7 * MiB);  // back up near the current rung
  sc.update(900 * KiB);
  ASSERT_NEAR(sc.update(900 * KiB).upper, 8 * MiB, 0.0);
  ASSERT_NEAR(sc.update(900 * KiB).upper, MiB, 0.0);
}

TEST(scaler_no_flicker_when_oscillating_near_a_rung) {
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  for (int i = 0; i < 20; ++i) {
    double v = (i % 2 == 0) ? 1.2 * MiB : 0.9 * MiB;
    ASSERT_NEAR(sc.update(v).upper, 2 * MiB, 0.0);
  }
}

TEST(scaler_headroom_keeps_peak_off_the_edge) {
  // Exactly 1 MiB with headroom needs more than the 1 MiB rung
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  ASSERT_NEAR(sc.update(MiB).upper, 2 * MiB, 0.0);
  AdaptiveScaler flush(LadderKind::BinaryBytes, 1.0, 3, 4);
  ASSERT_NEAR(flush.update(MiB).upper, MiB, 0.0);
}

TEST(scaler_decimal_ladder_is_one_two_five) {
  ASSERT_NEAR(vigil::app::ladder_ceil(LadderKind::Decimal125, 0.0), 1.0, 0.0);
  ASSERT_NEAR(vigil::app::ladder_ceil(LadderKind::Decimal125, 1.5), 2.0, 0.0);
  ASSERT_NEAR(vigil::app::ladder_ceil(LadderKind::Decimal125, 37.0), 50.0, 1e-9);
  ASSERT_NEAR(vigil::app::ladder_ceil(LadderKind::Decimal125, 100.0), 100.0, 1e-9);
  ASSERT_NEAR(vigil::app::ladder_ceil(LadderKind::Decimal125, 101.0), 200.0, 1e-9);
  auto below = vigil::app::ladder_below(LadderKind::Decimal125, 500.0);
  ASSERT_TRUE(below.has_value());
  ASSERT_NEAR(*below, 200.0, 1e-9);
  ASSERT_TRUE(!vigil::app::ladder_below(LadderKind::Decimal125, 1.0).has_value());
  auto b = AdaptiveScaler::fit(LadderKind::Decimal125, 72.0, 1.05, 4);
  ASSERT_NEAR(b.upper, 100.0, 1e-9);
  ASSERT_NEAR(b.step, 25.0, 1e-9);
}

TEST(scaler_percent_axis_is_fixed) {
  AdaptiveScaler sc(LadderKind::Percent, 1.05, 3, 5);
  ASSERT_NEAR(sc.update(3.0).upper, 100.0, 0.0);
  ASSERT_NEAR(sc.update(250.0).upper, 100.0, 0.0);
  ASSERT_NEAR(sc.current().step, 20.0, 0.0);
}

TEST(scaler_ignores_nan_samples) {
  vigil::app::HistoryStore h(60.0, 1.0);
  ASSERT_TRUE(h.append("m", 1.0, std::nan("")));
  ASSERT_TRUE(h.append("m", 2.0, 300 * KiB));
  ASSERT_TRUE(h.append("m", 3.0, std::nan("")));
  ASSERT_NEAR(vigil::app::finite_max(h.range("m", 0.0, 10.0)), 300 * KiB, 0.0);
  AdaptiveScaler sc(LadderKind::BinaryBytes);
  ASSERT_NEAR(sc.update(std::nan("")).upper, KiB, 0.0);
}

TEST(scaler_reset_forgets_axis) {
  AdaptiveScaler sc(LadderKind::BinaryBytes, 1.05, 3, 4);
  sc.update(5 * GiB);
  sc.reset();
  ASSERT_NEAR(sc.update(10 * KiB).upper, 16 * KiB, 0.0);
}
