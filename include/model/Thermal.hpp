#pragma once
#include <string>

namespace vigil::model {

struct TemperatureReading {
  std::string sensor_name;
  double celsius{};
};

} // namespace vigil::model
