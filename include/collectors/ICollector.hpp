#pragma once
#include <string>
#include "model/Snapshot.hpp"

namespace vigil::collectors {

// Platform telemetry source. Implementations live outside the core; tests and
// the benchmark supply scripted ones.
class ICollector {
public:
  virtual ~ICollector() = default;

  // Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() { return true; }

  // Fill `out` with one complete tick. A series that could not be read is
  // left out and its name appended to out.degraded_series; that is still a
  // success. Return false only when nothing usable was collected, with a
  // reason in `error`.
  [[nodiscard]] virtual bool poll(vigil::model::Snapshot& out, std::string& error) = 0;

  virtual void shutdown() {}

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace vigil::collectors
