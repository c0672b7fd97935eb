#include <kruise/sdk/info.hpp>

namespace kruise::sdk {

  std::string_view to_string(SandboxState state)
  {
    switch (state) {
    case SandboxState::RUNNING:
      return "running";
    case SandboxState::PAUSING:
      return "pausing";
    case SandboxState::PAUSED:
      return "paused";
    case SandboxState::TERMINATED:
      return "terminated";
    default:
      return "unknown";
    }
  }

  SandboxState state_from_string(std::string_view state)
  {
    if (state == "running") {
      return SandboxState::RUNNING;
    } else if (state == "pausing") {
      return SandboxState::PAUSING;
    } else if (state == "paused") {
      return SandboxState::PAUSED;
    } else if (state == "terminated" || state == "killed") {
      return SandboxState::TERMINATED;
    } else {
      return SandboxState::UNKNOWN;
    }
  }

} // namespace kruise::sdk
