#include <kruise/sdk/retry.hpp>

#include <kruise/sdk/config.hpp>

#include <string_view>

namespace kruise::sdk::retry {

  bool is_pausing_transient(const std::exception& exc)
  {
    if (dynamic_cast<const common::SandboxPausingError*>(&exc)) {
      return true;
    }
    return std::string_view{exc.what()}.find(PAUSING_MESSAGE) != std::string_view::npos;
  }

  bool is_execution_transient(const std::exception& exc)
  {
    // A failed command is a result, not a fault. Missing sandboxes and broken
    // configuration do not heal by waiting.
    if (dynamic_cast<const common::RetryExhaustedError*>(&exc) ||
        dynamic_cast<const common::CommandExitError*>(&exc) ||
        dynamic_cast<const common::StreamInterruptedError*>(&exc) ||
        dynamic_cast<const common::NotFoundError*>(&exc) ||
        dynamic_cast<const common::InvalidConfigurationError*>(&exc)) {
      return false;
    }
    return true;
  }

  Policy Policy::pausing(const config::Retry& cfg)
  {
    return pausing(cfg.max_attempts, std::chrono::milliseconds{cfg.delay_ms});
  }

  Policy Policy::pausing(int max_attempts, std::chrono::milliseconds delay)
  {
    return Policy{"connect", max_attempts, delay, is_pausing_transient};
  }

  Policy Policy::execution(const config::Retry& cfg)
  {
    return execution(cfg.max_attempts, std::chrono::milliseconds{cfg.delay_ms});
  }

  Policy Policy::execution(int max_attempts, std::chrono::milliseconds delay)
  {
    return Policy{"execution", max_attempts, delay, is_execution_transient};
  }

} // namespace kruise::sdk::retry
