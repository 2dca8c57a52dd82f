#pragma once
#include <cstdint>
#include <string>

namespace vigil::model {

struct DiskReading {
  std::string name;
  uint64_t read_bytes_total{};
  uint64_t write_bytes_total{};
};

} // namespace vigil::model
