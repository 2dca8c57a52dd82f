#include "app/AdaptiveScaler.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::app {

static constexpr double kMinBinaryRung = 1024.0;
static constexpr double kMinDecimalRung = 1.0;

double ladder_ceil(LadderKind kind, double v) {
  switch (kind) {
    case LadderKind::Percent:
      return 100.0;
    case LadderKind::BinaryBytes: {
      if (!(v > kMinBinaryRung)) return kMinBinaryRung;
      double r = std::exp2(std::ceil(std::log2(v)));
      // log2 rounding can land one rung low for exact powers
      while (r < v) r *= 2.0;
      return r;
    }
    case LadderKind::Decimal125: {
      if (!(v > kMinDecimalRung)) return kMinDecimalRung;
      double base = std::pow(10.0, std::floor(std::log10(v)));
      for (double m : {1.0, 2.0, 5.0, 10.0}) {
        if (m * base >= v) return m * base;
      }
      return 10.0 * base;
    }
  }
  return v;
}

std::optional<double> ladder_below(LadderKind kind, double rung) {
  switch (kind) {
    case LadderKind::Percent:
      return std::nullopt;
    case LadderKind::BinaryBytes:
      if (rung <= kMinBinaryRung) return std::nullopt;
      return rung / 2.0;
    case LadderKind::Decimal125: {
      if (rung <= kMinDecimalRung) return std::nullopt;
      double base = std::pow(10.0, std::floor(std::log10(rung) + 1e-9));
      double m = std::round(rung / base);
      if (m >= 5.0) return 2.0 * base;
      if (m >= 2.0) return 1.0 * base;
      return 0.5 * base;
    }
  }
  return std::nullopt;
}

double finite_max(const SeriesView& v) {
  double mx = 0.0;
  for (const auto& s : v) {
    if (std::isfinite(s.value) && s.value > mx) mx = s.value;
  }
  return mx;
}

AdaptiveScaler::AdaptiveScaler(LadderKind kind, double headroom, int shrink_ticks, int divisions)
    : kind_(kind),
      headroom_(std::clamp(headroom, 1.0, 1.1)),
      shrink_ticks_(std::max(1, shrink_ticks)),
      divisions_(std::max(1, divisions)) {}

AxisBounds AdaptiveScaler::fit(LadderKind kind, double observed_max, double headroom, int divisions) {
  double peak = std::isfinite(observed_max) && observed_max > 0 ? observed_max : 0.0;
  double upper = ladder_ceil(kind, peak * headroom);
  return AxisBounds{0.0, upper, upper / std::max(1, divisions)};
}

AxisBounds AdaptiveScaler::update(double observed_max) {
  double peak = std::isfinite(observed_max) && observed_max > 0 ? observed_max : 0.0;
  double need = peak * headroom_;
  double target = ladder_ceil(kind_, need);
  if (!primed_ || target > upper_) {
    upper_ = target;
    below_ticks_ = 0;
    primed_ = true;
    return current();
  }
  auto smaller = ladder_below(kind_, upper_);
  if (smaller && need <= *smaller) {
    if (++below_ticks_ >= shrink_ticks_) {
      upper_ = target;
      below_ticks_ = 0;
    }
  } else {
    below_ticks_ = 0;
  }
  return current();
}

AxisBounds AdaptiveScaler::current() const {
  double upper = primed_ ? upper_ : ladder_ceil(kind_, 0.0);
  return AxisBounds{0.0, upper, upper / divisions_};
}

void AdaptiveScaler::reset() {
  upper_ = 0.0;
  below_ticks_ = 0;
  primed_ = false;
}

} // namespace vigil::app
