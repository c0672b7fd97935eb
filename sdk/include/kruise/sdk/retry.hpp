#ifndef KRUISE_SDK_RETRY_HPP
#define KRUISE_SDK_RETRY_HPP

#include <kruise/common/exceptions.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace kruise::sdk::config {
  struct Retry;
} // namespace kruise::sdk::config

namespace kruise::sdk::retry {

  // Text the control plane returns while a sandbox is being suspended.
  constexpr const char* PAUSING_MESSAGE = "sandbox is pausing";

  bool is_pausing_transient(const std::exception& exc);

  bool is_execution_transient(const std::exception& exc);

  struct Policy {

    using predicate_t = std::function<bool(const std::exception&)>;

    std::string name;
    int max_attempts;
    std::chrono::milliseconds delay;
    predicate_t is_transient;

    static Policy pausing(const config::Retry& cfg);
    static Policy pausing(int max_attempts = 30, std::chrono::milliseconds delay = std::chrono::seconds{2});

    static Policy execution(const config::Retry& cfg);
    static Policy execution(int max_attempts = 5, std::chrono::milliseconds delay = std::chrono::seconds{5});
  };

  /**
   * @brief Invokes the operation until it succeeds, fails with an error the policy
   * does not consider transient, or the attempts are exhausted.
   *
   * Terminal errors are rethrown unchanged, annotated with the number of attempts.
   * After the last transient failure, common::RetryExhaustedError is thrown with the
   * final error nested inside.
   *
   * The delay blocks only the calling thread.
   */
  template <typename F>
  auto execute_with_retry(F&& operation, const Policy& policy) -> std::invoke_result_t<F&>
  {
    if (policy.max_attempts < 1) {
      throw common::InvalidConfigurationError(
          fmt::format("Retry policy {} needs at least one attempt", policy.name)
      );
    }

    for (int attempt = 1;; ++attempt) {

      try {
        return operation();
      } catch (std::exception& exc) {

        bool transient = policy.is_transient && policy.is_transient(exc);
        if (!transient) {
          if (auto* ptr = dynamic_cast<common::KruiseException*>(&exc)) {
            ptr->attempts(attempt);
          }
          throw;
        }

        if (attempt >= policy.max_attempts) {
          spdlog::error(
              "[{}] giving up after {} attempts, last error: {}", policy.name, attempt, exc.what()
          );
          throw common::RetryExhaustedError{
              policy.name, attempt, exc.what(), std::current_exception()};
        }

        spdlog::warn(
            "[{}] attempt {}/{} failed, retrying in {} ms: {}", policy.name, attempt,
            policy.max_attempts, policy.delay.count(), exc.what()
        );
      }

      std::this_thread::sleep_for(policy.delay);
    }
  }

} // namespace kruise::sdk::retry

#endif
