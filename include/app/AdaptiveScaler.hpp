#pragma once
#include <optional>
#include "app/HistoryStore.hpp"

namespace vigil::app {

// Candidate axis maxima ("rungs").
//  BinaryBytes: powers of two from 1 KiB (1 KiB, 2 KiB, ... 512 KiB, 1 MiB, ...)
//  Decimal125:  1, 2, 5 x 10^k from 1 upward
//  Percent:     fixed 0..100
enum class LadderKind { BinaryBytes, Decimal125, Percent };

struct AxisBounds {
  double lower{0.0};
  double upper{0.0};
  double step{0.0}; // label spacing, upper / divisions
};

// Smallest rung >= v.
double ladder_ceil(LadderKind kind, double v);
// Rung directly below `rung`, nullopt at the bottom of the ladder.
std::optional<double> ladder_below(LadderKind kind, double rung);

// Largest finite value in the view, 0 if there is none.
double finite_max(const SeriesView& v);

// Per-metric axis state. Grows to a larger rung as soon as the visible peak
// needs it, shrinks only after the peak has fit under a smaller rung for
// `shrink_ticks` consecutive updates.
class AdaptiveScaler {
public:
  AdaptiveScaler(LadderKind kind, double headroom = 1.05, int shrink_ticks = 3, int divisions = 4);

  // One tick with the peak of the current visible window.
  AxisBounds update(double observed_max);
  AxisBounds update(const SeriesView& window) { return update(finite_max(window)); }

  [[nodiscard]] AxisBounds current() const;
  [[nodiscard]] LadderKind kind() const { return kind_; }
  void reset();

  // Stateless fit without hysteresis.
  static AxisBounds fit(LadderKind kind, double observed_max, double headroom, int divisions);

private:
  LadderKind kind_;
  double headroom_;
  int shrink_ticks_;
  int divisions_;
  double upper_{0.0};
  int below_ticks_{0};
  bool primed_{false};
};

} // namespace vigil::app
