#pragma once
#include <cstdint>
#include <string>

namespace vigil::app {

struct KillResult {
  bool success{false};
  std::string error_message;
};

// OS termination layer. May report failure through the result or by
// throwing; the coordinator handles both per target.
class IProcessKiller {
public:
  virtual ~IProcessKiller() = default;
  virtual KillResult terminate(int32_t pid, int signal) = 0;
};

} // namespace vigil::app
