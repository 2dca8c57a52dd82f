#pragma once
#include <vector>

namespace vigil::model {

struct CpuReading {
  std::vector<double> per_core_pct; // 0..100 each
  double average_pct{};             // 0..100
};

} // namespace vigil::model
