#include "model/Process.hpp"

namespace vigil::model {

ProcState state_from_char(char c) {
  switch (c) {
    case 'R': return ProcState::Running;
    case 'S': return ProcState::Sleeping;
    case 'D': return ProcState::DiskSleep;
    case 'T': case 't': return ProcState::Stopped;
    case 'Z': case 'X': return ProcState::Zombie;
    case 'I': return ProcState::Idle;
    default: return ProcState::Unknown;
  }
}

const char* state_name(ProcState s) {
  switch (s) {
    case ProcState::Running: return "running";
    case ProcState::Sleeping: return "sleeping";
    case ProcState::DiskSleep: return "disk-sleep";
    case ProcState::Stopped: return "stopped";
    case ProcState::Zombie: return "zombie";
    case ProcState::Idle: return "idle";
    case ProcState::Unknown: return "unknown";
  }
  return "unknown";
}

} // namespace vigil::model
