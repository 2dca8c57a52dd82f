#pragma once
#include <cstdint>

namespace vigil::model {

// Aggregated over all interfaces
struct NetworkReading {
  uint64_t rx_bytes_total{};
  uint64_t tx_bytes_total{};
};

} // namespace vigil::model
